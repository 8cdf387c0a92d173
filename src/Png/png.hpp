#ifndef PNG_HPP
#define PNG_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "Chunk/chunk.hpp"
#include "Chunk/chunkType.hpp"
#include "Utility/pngError.hpp"

/**
 * @brief In-memory PNG file: the fixed signature followed by an ordered chunk list.
 *
 * The container never looks inside chunk data. Parsing is strict: a single
 * malformed chunk fails the whole file. IHDR-first / IEND-last is expected
 * but not enforced.
 */
class Png {
public:
    static constexpr std::array<uint8_t, 8> STANDARD_HEADER = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

private:
    std::vector<Chunk> chunkList;

public:
    Png() = default;
    explicit Png(std::vector<Chunk> chunks) : chunkList(std::move(chunks)) {}

    /**
     * @brief Parse a complete PNG byte sequence.
     *
     * @param bytes Entire file contents
     * @return The container, or InvalidSignature, TrailingBytes, or the first
     *         chunk error annotated with its byte offset
     */
    static std::expected<Png, PngError> parse(std::span<const uint8_t> bytes);

    const std::array<uint8_t, 8>& header() const { return STANDARD_HEADER; }
    const std::vector<Chunk>& chunks() const { return chunkList; }

    void appendChunk(Chunk chunk);

    // Keeps the trailer (normally IEND) last
    void insertChunkBeforeEnd(Chunk chunk);

    // Removes the first chunk of that type
    std::expected<Chunk, PngError> removeChunk(const ChunkType& type);
    std::expected<Chunk, PngError> removeChunk(const std::string& type);

    const Chunk* chunkByType(const ChunkType& type) const;
    const Chunk* chunkByType(const std::string& type) const;

    std::vector<uint8_t> asBytes() const;

    friend bool operator==(const Png& lhs, const Png& rhs) {
        return lhs.chunkList == rhs.chunkList;
    }
};

std::ostream& operator<<(std::ostream& os, const Png& png);

#endif
