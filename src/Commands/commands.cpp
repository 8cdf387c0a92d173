#include "commands.hpp"

#include <string>
#include <vector>

using namespace std;

expected<vector<uint8_t>, PngError> encode(Png& png, const string& chunkType, const string& message) {

    auto type = ChunkType::fromString(chunkType);
    if (!type) return unexpected(type.error());

    if (!type->isValid()) {
        return unexpected(PngError(PngErrorKind::InvalidChunkType,
            "Chunk type '" + chunkType + "' has its reserved bit set").forChunk(chunkType));
    }

    if (!Chunk::fitsDataLength(message.size())) {
        return unexpected(PngError(PngErrorKind::InvalidLength,
            "Message of " + to_string(message.size()) + " bytes does not fit in a chunk"));
    }

    png.insertChunkBeforeEnd(Chunk(type.value(), vector<uint8_t>(message.begin(), message.end())));
    return png.asBytes();
}

expected<string, PngError> decode(const Png& png, const string& chunkType) {

    const Chunk* chunk = png.chunkByType(chunkType);
    if (!chunk) {
        return unexpected(PngError(PngErrorKind::ChunkNotFound,
            "No chunk of type " + chunkType).forChunk(chunkType));
    }

    return chunk->dataAsString();
}

expected<RemoveResult, PngError> remove(Png& png, const string& chunkType) {

    auto removed = png.removeChunk(chunkType);
    if (!removed) return unexpected(removed.error());

    return RemoveResult{std::move(removed.value()), png.asBytes()};
}
