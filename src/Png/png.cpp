#include "png.hpp"

#include <algorithm>
#include <string>
#include <iostream>

using namespace std;

expected<Png, PngError> Png::parse(span<const uint8_t> bytes) {

    if (bytes.size() < STANDARD_HEADER.size()
        || !equal(STANDARD_HEADER.begin(), STANDARD_HEADER.end(), bytes.begin())) {
        return unexpected(PngError(PngErrorKind::InvalidSignature,
            "Input does not start with the PNG signature"));
    }

    vector<Chunk> chunks;
    size_t position = STANDARD_HEADER.size();

    while (position < bytes.size()) {
        size_t remaining = bytes.size() - position;

        // Too short to hold even an empty chunk
        if (remaining < Chunk::OVERHEAD_SIZE) {
            return unexpected(PngError(PngErrorKind::TrailingBytes,
                to_string(remaining) + " trailing bytes after chunk #" + to_string(chunks.size()))
                .atOffset(position));
        }

        auto chunkResult = Chunk::parse(bytes.subspan(position));
        if (!chunkResult) {
            PngError error = chunkResult.error();
            error.message = "Chunk #" + to_string(chunks.size()) + ": " + error.message;
            error.atOffset(position);
            return unexpected(error);
        }

        position += chunkResult->wireSize();
        chunks.push_back(std::move(chunkResult.value()));
    }

    return Png(std::move(chunks));
}

void Png::appendChunk(Chunk chunk) {
    chunkList.push_back(std::move(chunk));
}

void Png::insertChunkBeforeEnd(Chunk chunk) {
    if (chunkList.empty()) {
        chunkList.push_back(std::move(chunk));
        return;
    }
    chunkList.insert(chunkList.end() - 1, std::move(chunk));
}

expected<Chunk, PngError> Png::removeChunk(const ChunkType& type) {
    return removeChunk(type.toString());
}

expected<Chunk, PngError> Png::removeChunk(const string& type) {
    auto it = find_if(chunkList.begin(), chunkList.end(), [&type](const Chunk& chunk) {
        return chunk.chunkType().toString() == type;
    });

    if (it == chunkList.end()) {
        return unexpected(PngError(PngErrorKind::ChunkNotFound,
            "No chunk of type " + type).forChunk(type));
    }

    Chunk removed = std::move(*it);
    chunkList.erase(it);
    return removed;
}

const Chunk* Png::chunkByType(const ChunkType& type) const {
    return chunkByType(type.toString());
}

const Chunk* Png::chunkByType(const string& type) const {
    for (const Chunk& chunk : chunkList) {
        if (chunk.chunkType().toString() == type) return &chunk;
    }
    return nullptr;
}

vector<uint8_t> Png::asBytes() const {
    size_t total = STANDARD_HEADER.size();
    for (const Chunk& chunk : chunkList) {
        total += chunk.wireSize();
    }

    vector<uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), STANDARD_HEADER.begin(), STANDARD_HEADER.end());

    for (const Chunk& chunk : chunkList) {
        vector<uint8_t> chunkBytes = chunk.asBytes();
        out.insert(out.end(), chunkBytes.begin(), chunkBytes.end());
    }
    return out;
}

ostream& operator<<(ostream& os, const Png& png) {
    os << "PNG with " << png.chunks().size() << " chunks" << endl;
    for (const Chunk& chunk : png.chunks()) {
        os << chunk << endl;
    }
    return os;
}
