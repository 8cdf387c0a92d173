#include <catch2/catch_all.hpp>
#include "Commands/commands.hpp"
#include "testFixtures.hpp"

#include <string>
#include <vector>

using namespace fixtures;

TEST_CASE("encode hides a message before the trailer", "[commands][encode]") {

    Png png = makeTestPng();
    size_t before = png.chunks().size();

    SECTION("New chunk sits just before IEND") {
        auto encoded = encode(png, "ruSt", "hello");
        REQUIRE(encoded.has_value());
        REQUIRE(png.chunks().size() == before + 1);
        REQUIRE(png.chunks()[png.chunks().size() - 2].chunkType().toString() == "ruSt");
        REQUIRE(png.chunks().back().chunkType().toString() == "IEND");
    }

    SECTION("Returned bytes are the serialized PNG") {
        auto encoded = encode(png, "ruSt", "hello");
        REQUIRE(encoded.value() == png.asBytes());

        auto reparsed = Png::parse(encoded.value());
        REQUIRE(reparsed.has_value());
        REQUIRE(reparsed.value() == png);
    }

    SECTION("Invalid chunk types are rejected and leave the PNG alone") {
        REQUIRE(encode(png, "ru1t", "hello").error().kind == PngErrorKind::InvalidChunkType);
        REQUIRE(encode(png, "ruStX", "hello").error().kind == PngErrorKind::InvalidChunkType);
        REQUIRE(encode(png, "rust", "hello").error().kind == PngErrorKind::InvalidChunkType);
        REQUIRE(png.chunks().size() == before);
    }

    SECTION("Encoding twice stores two chunks of the same type") {
        REQUIRE(encode(png, "ruSt", "first").has_value());
        REQUIRE(encode(png, "ruSt", "second").has_value());
        REQUIRE(png.chunks().size() == before + 2);
        REQUIRE(decode(png, "ruSt").value() == "first");
    }

    SECTION("Empty message") {
        REQUIRE(encode(png, "ruSt", "").has_value());
        REQUIRE(decode(png, "ruSt").value().empty());
    }
}

TEST_CASE("decode reads a hidden message", "[commands][decode]") {

    Png png = makeTestPng();

    SECTION("Encode then decode gives back the message") {
        auto encoded = encode(png, "ruSt", "hello");
        auto reparsed = Png::parse(encoded.value());
        REQUIRE(decode(reparsed.value(), "ruSt").value() == "hello");
    }

    SECTION("Missing chunk") {
        REQUIRE(decode(png, "ruSt").error().kind == PngErrorKind::ChunkNotFound);
    }

    SECTION("Binary payload") {
        REQUIRE(decode(png, "IDAT").error().kind == PngErrorKind::InvalidUtf8);
    }
}

TEST_CASE("remove deletes a hidden message", "[commands][remove]") {

    Png png = makeTestPng();

    SECTION("Remove then decode fails") {
        auto encoded = encode(png, "ruSt", "hello");
        Png reparsed = Png::parse(encoded.value()).value();

        auto removed = remove(reparsed, "ruSt");
        REQUIRE(removed.has_value());
        REQUIRE(removed->removed.dataAsString().value() == "hello");

        Png afterRemove = Png::parse(removed->bytes).value();
        REQUIRE(decode(afterRemove, "ruSt").error().kind == PngErrorKind::ChunkNotFound);
        REQUIRE(afterRemove == makeTestPng());
    }

    SECTION("Missing chunk leaves the sequence unchanged") {
        std::vector<uint8_t> before = png.asBytes();
        auto removed = remove(png, "zzZz");
        REQUIRE(removed.error().kind == PngErrorKind::ChunkNotFound);
        REQUIRE(png.chunks().size() == 4);
        REQUIRE(png.asBytes() == before);
    }
}

TEST_CASE("print lists every chunk in order", "[commands][print]") {

    Png png = makeTestPng();
    REQUIRE(encode(png, "ruSt", "hello").has_value());

    std::vector<std::string> types;
    std::vector<ChunkSummary> summaries;
    for (const ChunkSummary& summary : print(png)) {
        types.push_back(summary.type);
        summaries.push_back(summary);
    }

    REQUIRE(types == std::vector<std::string>{"IHDR", "tEXt", "IDAT", "ruSt", "IEND"});
    REQUIRE(summaries[3].text == "hello");
    REQUIRE(summaries[3].length == 5);
    REQUIRE_FALSE(summaries[2].text.has_value());
    REQUIRE(summaries[2].toString().find("Non UTF-8") != std::string::npos);
    REQUIRE(png.chunks().size() == 5);
}
