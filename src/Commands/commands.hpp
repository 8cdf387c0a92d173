#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "Chunk/chunk.hpp"
#include "Png/png.hpp"
#include "Commands/chunkSummary.hpp"
#include "Utility/pngError.hpp"

/**
 * @brief Outcome of a successful remove: the chunk taken out and the
 * re-serialized file that no longer contains it.
 */
struct RemoveResult {
    Chunk removed;
    std::vector<uint8_t> bytes;
};

/**
 * @brief Hide a message in a new chunk placed just before the trailer chunk.
 *
 * @param png Container to modify
 * @param chunkType Textual chunk type, must be a valid type (e.g. "ruSt")
 * @param message Bytes to store
 * @return Serialized PNG, or InvalidChunkType / InvalidLength. On failure
 *         the container is left unchanged.
 */
std::expected<std::vector<uint8_t>, PngError> encode(
    Png& png, const std::string& chunkType, const std::string& message);

/**
 * @brief Read back the first hidden message of the given type.
 *
 * @return The message text, or ChunkNotFound / InvalidUtf8
 */
std::expected<std::string, PngError> decode(const Png& png, const std::string& chunkType);

/**
 * @brief Remove the first chunk of the given type.
 *
 * @return The removed chunk and the re-serialized PNG, or ChunkNotFound
 */
std::expected<RemoveResult, PngError> remove(Png& png, const std::string& chunkType);

// Lazy per-chunk summaries, see printChunks()
inline auto print(const Png& png) { return printChunks(png); }

#endif
