#include "pngFileIO.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <system_error>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

using namespace std;

expected<vector<uint8_t>, PngError> PngFileIO::readFile(const string& path) {

    error_code ec;
    if (!filesystem::is_regular_file(path, ec)) {
        return unexpected(PngError(PngErrorKind::IoError, "No such file: " + path));
    }

    uintmax_t fileSize = filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(PngError(PngErrorKind::IoError,
            "Failed to stat " + path + ": " + ec.message()));
    }
    if (fileSize > MAX_INPUT_FILE_SIZE) {
        return unexpected(PngError(PngErrorKind::IoError,
            path + " is " + to_string(fileSize) + " bytes, larger than the "
            + to_string(MAX_INPUT_FILE_SIZE) + " byte limit"));
    }

    ifstream in(path, ios::binary);
    if (!in) {
        return unexpected(PngError(PngErrorKind::IoError,
            "Failed to open " + path + ": " + string(strerror(errno))));
    }

    vector<uint8_t> buffer(static_cast<size_t>(fileSize));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<streamsize>(buffer.size()));
    if (static_cast<uintmax_t>(in.gcount()) != fileSize) {
        return unexpected(PngError(PngErrorKind::IoError, "Short read from " + path));
    }

    return buffer;
}

expected<void, PngError> PngFileIO::writeFile(const string& path, const vector<uint8_t>& bytes) {

    error_code ec;
    bool createdTarget = !filesystem::exists(path, ec);

    // Create the file so it can be locked
    {
    ofstream touch(path, ios::app | ios::binary);
    if (!touch) {
        return unexpected(PngError(PngErrorKind::IoError,
            "Failed to create " + path + ": " + string(strerror(errno))));
    }
    }

    unique_ptr<boost::interprocess::file_lock> fileLock;
    try {
        fileLock = make_unique<boost::interprocess::file_lock>(path.c_str());
    } catch (const boost::interprocess::interprocess_exception& e) {
        cleanUpFailedWrite(path, false, createdTarget);
        return unexpected(PngError(PngErrorKind::IoError,
            "Failed to acquire file lock: " + string(e.what())));
    }

    if (!fileLock->try_lock()) {
        cleanUpFailedWrite(path, false, createdTarget);
        return unexpected(PngError(PngErrorKind::IoError,
            path + " is already locked by another process"));
    }
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> guard(*fileLock, boost::interprocess::accept_ownership);

    string tempPath = tempPathFor(path);
    {
        ofstream out(tempPath, ios::binary | ios::trunc);
        if (!out) {
            string reason = strerror(errno);
            cleanUpFailedWrite(path, false, createdTarget);
            return unexpected(PngError(PngErrorKind::IoError, "Failed to open temp file: " + reason));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            out.close();
            cleanUpFailedWrite(path, true, createdTarget);
            return unexpected(PngError(PngErrorKind::IoError, "Failed to write temp file " + tempPath));
        }
    }

    // Validate temp file
    uintmax_t written = filesystem::file_size(tempPath, ec);
    if (ec || written != bytes.size()) {
        cleanUpFailedWrite(path, true, createdTarget);
        return unexpected(PngError(PngErrorKind::IoError,
            "Temp file " + tempPath + " failed validation"));
    }

    // Atomic replace (rename temp to original)
    filesystem::rename(tempPath, path, ec);
    if (ec) {
        string reason = ec.message();
        cleanUpFailedWrite(path, true, createdTarget);
        return unexpected(PngError(PngErrorKind::IoError,
            "Failed to rename temp file: " + reason));
    }

    return {};
}

void PngFileIO::cleanUpFailedWrite(const string& path, bool tempOpened, bool createdTarget) {
    error_code ec;
    if (tempOpened) {
        string tempPath = tempPathFor(path);
        filesystem::remove(tempPath, ec);
        if (ec) {
            cerr << "Failed to remove temp file " << tempPath << ": " << ec.message() << endl;
        }
    }

    // Only the empty placeholder made by this call, never a file that was already there
    if (createdTarget && filesystem::is_regular_file(path, ec) && filesystem::is_empty(path, ec)) {
        filesystem::remove(path, ec);
    }
}
