#include <catch2/catch_all.hpp>
#include "IO/pngFileIO.hpp"
#include "Png/blankImage.hpp"
#include "Png/png.hpp"
#include "Commands/commands.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST_CASE("PngFileIO reads and writes whole files", "[pngFileIO][io]") {

    fs::path testDir = "build/tests_tmp/png_file_io";
    fs::create_directories(testDir);
    std::string path = (testDir / "canvas.png").string();
    fs::remove(path);

    std::vector<uint8_t> canvas = BlankImage::create(4, 4).value();

    SECTION("Write then read returns identical bytes") {
        REQUIRE(PngFileIO::writeFile(path, canvas).has_value());
        REQUIRE(fs::exists(path));
        REQUIRE_FALSE(fs::exists(PngFileIO::tempPathFor(path)));

        auto read = PngFileIO::readFile(path);
        REQUIRE(read.has_value());
        REQUIRE(read.value() == canvas);
    }

    SECTION("Overwrite replaces the previous contents") {
        REQUIRE(PngFileIO::writeFile(path, std::vector<uint8_t>(100, 0xAA)).has_value());
        REQUIRE(PngFileIO::writeFile(path, canvas).has_value());
        REQUIRE(fs::file_size(path) == canvas.size());
        REQUIRE(PngFileIO::readFile(path).value() == canvas);
    }

    SECTION("Missing file") {
        auto read = PngFileIO::readFile((testDir / "does_not_exist.png").string());
        REQUIRE_FALSE(read.has_value());
        REQUIRE(read.error().kind == PngErrorKind::IoError);
    }

    SECTION("Directory is not a file") {
        REQUIRE(PngFileIO::readFile(testDir.string()).error().kind == PngErrorKind::IoError);
    }

    SECTION("Unwritable destination") {
        auto written = PngFileIO::writeFile((testDir / "no_such_dir" / "out.png").string(), canvas);
        REQUIRE(written.error().kind == PngErrorKind::IoError);
    }

    fs::remove(path);
}

TEST_CASE("PngFileIO leaves the target alone when a write fails", "[pngFileIO][io][failure]") {

    fs::path testDir = "build/tests_tmp/png_file_io_failure";
    fs::remove_all(testDir);
    fs::create_directories(testDir);
    std::string path = (testDir / "out.png").string();

    // A directory sitting on the temp path makes the temp file impossible to open
    fs::path blocker = fs::path(PngFileIO::tempPathFor(path)) / "blocker";
    fs::create_directories(blocker.parent_path());
    std::ofstream(blocker) << "x";

    std::vector<uint8_t> bytes = {1, 2, 3};

    SECTION("Existing empty target survives") {
        std::ofstream(path, std::ios::binary).close();
        REQUIRE(fs::exists(path));

        auto written = PngFileIO::writeFile(path, bytes);
        REQUIRE_FALSE(written.has_value());
        REQUIRE(written.error().kind == PngErrorKind::IoError);
        REQUIRE(fs::exists(path));
        REQUIRE(fs::file_size(path) == 0);
    }

    SECTION("Existing contents are kept") {
        std::vector<uint8_t> previous = BlankImage::create(2, 2).value();
        {
            std::ofstream out(path, std::ios::binary);
            out.write(reinterpret_cast<const char*>(previous.data()), static_cast<std::streamsize>(previous.size()));
        }

        REQUIRE_FALSE(PngFileIO::writeFile(path, bytes).has_value());
        REQUIRE(PngFileIO::readFile(path).value() == previous);
    }

    SECTION("Placeholder for a new target is removed") {
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE_FALSE(PngFileIO::writeFile(path, bytes).has_value());
        REQUIRE_FALSE(fs::exists(path));
    }

    // Whatever was on the temp path is not ours to delete
    REQUIRE(fs::exists(blocker));

    fs::remove_all(testDir);
}

TEST_CASE("Hidden message survives a trip through the file system", "[pngFileIO][integration]") {

    fs::path testDir = "build/tests_tmp/png_file_io";
    fs::create_directories(testDir);
    std::string path = (testDir / "message.png").string();

    REQUIRE(PngFileIO::writeFile(path, BlankImage::create(8, 8).value()).has_value());

    // encode
    Png png = Png::parse(PngFileIO::readFile(path).value()).value();
    auto encoded = encode(png, "ruSt", "a message in a file");
    REQUIRE(encoded.has_value());
    REQUIRE(PngFileIO::writeFile(path, encoded.value()).has_value());

    // decode
    Png reloaded = Png::parse(PngFileIO::readFile(path).value()).value();
    REQUIRE(decode(reloaded, "ruSt").value() == "a message in a file");

    // remove
    auto removed = remove(reloaded, "ruSt");
    REQUIRE(removed.has_value());
    REQUIRE(PngFileIO::writeFile(path, removed->bytes).has_value());

    Png cleaned = Png::parse(PngFileIO::readFile(path).value()).value();
    REQUIRE(decode(cleaned, "ruSt").error().kind == PngErrorKind::ChunkNotFound);

    fs::remove(path);
}
