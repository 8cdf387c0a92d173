#include "chunkType.hpp"

#include <algorithm>
#include <string>
#include <iostream>

using namespace std;

bool ChunkType::isTypeByte(uint8_t byte) {
    return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
}

expected<ChunkType, PngError> ChunkType::fromString(const string& str) {
    if (str.size() != 4) {
        return unexpected(PngError(PngErrorKind::InvalidChunkType,
            "Chunk type must be exactly 4 bytes, got " + to_string(str.size())));
    }

    array<uint8_t, 4> bytes;
    for (size_t i = 0; i < bytes.size(); i++) {
        bytes[i] = static_cast<uint8_t>(str[i]);
        if (!isTypeByte(bytes[i])) {
            return unexpected(PngError(PngErrorKind::InvalidChunkType,
                "Chunk type '" + str + "' contains non alphabetic characters"));
        }
    }

    return ChunkType(bytes);
}

bool ChunkType::isValid() const {
    bool allLetters = all_of(typeBytes.begin(), typeBytes.end(), isTypeByte);
    return allLetters && isReservedBitValid();
}

string ChunkType::toString() const {
    return string(typeBytes.begin(), typeBytes.end());
}

ostream& operator<<(ostream& os, const ChunkType& type) {
    return os << type.toString();
}
