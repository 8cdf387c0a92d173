#ifndef TEST_FIXTURES_HPP
#define TEST_FIXTURES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "Chunk/chunk.hpp"
#include "Chunk/chunkType.hpp"
#include "Png/png.hpp"

namespace fixtures {

inline const std::string SECRET_MESSAGE = "This is where your secret message will be!";
inline constexpr uint32_t SECRET_MESSAGE_CRC = 2882656334u;

inline std::vector<uint8_t> toBytes(const std::string& str) {
    return std::vector<uint8_t>(str.begin(), str.end());
}

inline Chunk makeChunk(const std::string& type, const std::string& data) {
    return Chunk(ChunkType::fromString(type).value(), toBytes(data));
}

// Raw wire bytes with a caller-chosen CRC
inline std::vector<uint8_t> rawChunk(const std::string& type, const std::string& data, uint32_t crc) {
    std::vector<uint8_t> bytes;
    uint32_t length = static_cast<uint32_t>(data.size());
    for (int shift = 24; shift >= 0; shift -= 8) bytes.push_back(static_cast<uint8_t>(length >> shift));
    bytes.insert(bytes.end(), type.begin(), type.end());
    bytes.insert(bytes.end(), data.begin(), data.end());
    for (int shift = 24; shift >= 0; shift -= 8) bytes.push_back(static_cast<uint8_t>(crc >> shift));
    return bytes;
}

// Small but structurally plausible PNG: IHDR, a text chunk, IDAT, IEND
inline Png makeTestPng() {
    std::vector<Chunk> chunks;
    chunks.push_back(makeChunk("IHDR", std::string("\x00\x00\x00\x01\x00\x00\x00\x01\x08\x02\x00\x00\x00", 13)));
    chunks.push_back(makeChunk("tEXt", std::string("Comment\0made by hand", 20)));
    chunks.push_back(Chunk(ChunkType::fromString("IDAT").value(), {0x78, 0x9C, 0x63, 0xF8, 0xCF, 0xC0, 0x00, 0x00, 0x03, 0x01, 0x01, 0x00}));
    chunks.push_back(makeChunk("IEND", ""));
    return Png(std::move(chunks));
}

}

#endif
