#ifndef CHUNK_SUMMARY_HPP
#define CHUNK_SUMMARY_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>

#include <nlohmann/json.hpp>

#include "Chunk/chunk.hpp"
#include "Png/png.hpp"

// Human readable view of one chunk
struct ChunkSummary {
    std::string type;
    uint32_t length;
    uint32_t crc;
    std::optional<std::string> text;  // empty when the data is binary

    std::string toString() const;
    nlohmann::json toJson() const;
};

ChunkSummary summarizeChunk(const Chunk& chunk);

/**
 * @brief Lazily summarize every chunk of a PNG, in file order.
 *
 * Nothing is decoded until the range is iterated. The range refers to the
 * PNG's chunks, so the PNG must outlive it.
 */
inline auto printChunks(const Png& png) {
    return std::views::all(png.chunks()) | std::views::transform(summarizeChunk);
}

/**
 * @brief Machine readable description of a PNG's chunk list.
 *
 * Shape: { "success", "chunk_count", "chunks": [ { "index", "type", "length",
 * "crc", "critical", "public", "safe_to_copy", "text" | "binary" } ] }
 */
nlohmann::json summarize(const Png& png);

std::ostream& operator<<(std::ostream& os, const ChunkSummary& summary);

#endif
