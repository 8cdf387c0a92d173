#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <cstdint>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "Chunk/chunkType.hpp"
#include "Utility/pngError.hpp"

/**
 * @brief A single PNG chunk: type, data and the CRC over both.
 *
 * Wire layout is length (4 bytes BE) | type (4) | data (length) | crc (4 BE).
 * Length and CRC are derived from the stored type and data, so a Chunk can
 * never carry a mismatched checksum. Chunks are immutable once built.
 */
class Chunk {
public:
    // length + type + crc
    static constexpr size_t OVERHEAD_SIZE = 12;
    static constexpr uint32_t MAX_DATA_LENGTH = 0x7FFFFFFF;

private:
    ChunkType type;
    std::vector<uint8_t> chunkData;
    uint32_t checksum;

    static uint32_t computeCrc(const ChunkType& type, std::span<const uint8_t> data);

public:
    /**
     * @brief Build a chunk from a type and its data.
     *
     * @throws std::length_error if data is longer than MAX_DATA_LENGTH.
     *         Check fitsDataLength() first when the size comes from input.
     */
    Chunk(ChunkType chunkType, std::vector<uint8_t> data);

    static bool fitsDataLength(uint64_t size) { return size <= MAX_DATA_LENGTH; }

    /**
     * @brief Parse one chunk from the front of a byte buffer.
     *
     * Bytes following the chunk are ignored; use wireSize() to step past it.
     *
     * @param bytes Buffer starting at the chunk's length field
     * @return The parsed chunk, or UnexpectedEof, InvalidLength,
     *         InvalidChunkType or CrcMismatch
     */
    static std::expected<Chunk, PngError> parse(std::span<const uint8_t> bytes);

    uint32_t length() const { return static_cast<uint32_t>(chunkData.size()); }
    uint32_t crc() const { return checksum; }
    const ChunkType& chunkType() const { return type; }
    const std::vector<uint8_t>& data() const { return chunkData; }
    size_t wireSize() const { return OVERHEAD_SIZE + chunkData.size(); }

    std::expected<std::string, PngError> dataAsString() const;

    std::vector<uint8_t> asBytes() const;

    friend bool operator==(const Chunk& lhs, const Chunk& rhs) {
        return lhs.type == rhs.type && lhs.chunkData == rhs.chunkData;
    }
};

// True if the bytes are well-formed UTF-8
bool isValidUtf8(std::span<const uint8_t> bytes);

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

#endif
