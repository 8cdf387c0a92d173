#include "chunkSummary.hpp"

#include <sstream>
#include <string>

using namespace std;

ChunkSummary summarizeChunk(const Chunk& chunk) {
    ChunkSummary summary;
    summary.type = chunk.chunkType().toString();
    summary.length = chunk.length();
    summary.crc = chunk.crc();

    auto text = chunk.dataAsString();
    if (text) summary.text = std::move(text.value());

    return summary;
}

string ChunkSummary::toString() const {
    ostringstream oss;
    oss << type << " (" << length << " bytes): ";
    if (text) {
        oss << *text;
    }
    else {
        oss << "{Non UTF-8 data}";
    }
    return oss.str();
}

nlohmann::json ChunkSummary::toJson() const {
    nlohmann::json result;
    result["type"] = type;
    result["length"] = length;
    result["crc"] = crc;
    if (text) {
        result["text"] = *text;
    }
    else {
        result["binary"] = true;
    }
    return result;
}

nlohmann::json summarize(const Png& png) {
    nlohmann::json result;
    result["success"] = true;
    result["chunk_count"] = png.chunks().size();

    nlohmann::json chunkList = nlohmann::json::array();
    size_t index = 0;
    for (const Chunk& chunk : png.chunks()) {
        nlohmann::json chunkInfo = summarizeChunk(chunk).toJson();
        chunkInfo["index"] = index++;
        chunkInfo["critical"] = chunk.chunkType().isCritical();
        chunkInfo["public"] = chunk.chunkType().isPublic();
        chunkInfo["safe_to_copy"] = chunk.chunkType().isSafeToCopy();
        chunkList.push_back(chunkInfo);
    }
    result["chunks"] = chunkList;

    return result;
}

ostream& operator<<(ostream& os, const ChunkSummary& summary) {
    return os << summary.toString();
}
