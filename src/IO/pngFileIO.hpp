#ifndef PNG_FILE_IO_HPP
#define PNG_FILE_IO_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "Utility/pngError.hpp"

/**
 * @brief File glue for pngme: whole-file reads and atomic, locked writes.
 *
 * Writes never touch the target until the new contents are complete on disk:
 * the bytes go to "<path>.tmp", the temp file is checked, then renamed over
 * the target. A boost file lock on the target is held for the whole write so
 * concurrent pngme processes cannot interleave.
 */
class PngFileIO {
public:
    static constexpr uint64_t MAX_INPUT_FILE_SIZE = 512ull * 1024 * 1024; // 512 MiB

    /**
     * @brief Read a whole file into memory.
     *
     * @param path File to read
     * @return File contents, or IoError if the file is missing, unreadable
     *         or larger than MAX_INPUT_FILE_SIZE
     */
    static std::expected<std::vector<uint8_t>, PngError> readFile(const std::string& path);

    /**
     * @brief Atomically replace (or create) a file with the given bytes.
     *
     * @param path Destination file
     * @param bytes New contents
     * @return Nothing on success, IoError otherwise. On failure the
     *         destination keeps its previous contents.
     */
    static std::expected<void, PngError> writeFile(const std::string& path, const std::vector<uint8_t>& bytes);

    static std::string tempPathFor(const std::string& path) { return path + ".tmp"; }

private:
    // Utility class
    PngFileIO() = delete;

    // Removes the temp file if this write opened it, and the target if this write created it
    static void cleanUpFailedWrite(const std::string& path, bool tempOpened, bool createdTarget);
};

#endif
