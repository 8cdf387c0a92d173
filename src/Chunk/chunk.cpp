#include "chunk.hpp"
#include "Utility/byteOrder.hpp"

#include <zlib.h>
#include <boost/locale/encoding_utf.hpp>

#include <algorithm>
#include <string>
#include <iostream>
#include <stdexcept>

using namespace std;

Chunk::Chunk(ChunkType chunkType, vector<uint8_t> data)
    : type(chunkType), chunkData(std::move(data)) {
    if (!fitsDataLength(chunkData.size())) {
        throw length_error("Chunk data of " + to_string(chunkData.size())
            + " bytes exceeds the 2^31-1 byte limit");
    }
    checksum = computeCrc(type, chunkData);
}

uint32_t Chunk::computeCrc(const ChunkType& type, span<const uint8_t> data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, type.bytes().data(), static_cast<uInt>(type.bytes().size()));

    // zlib takes uInt lengths, feed large payloads in slices
    const uint8_t* cursor = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        uInt slice = static_cast<uInt>(min<size_t>(remaining, 1u << 30));
        crc = crc32(crc, cursor, slice);
        cursor += slice;
        remaining -= slice;
    }
    return static_cast<uint32_t>(crc);
}

expected<Chunk, PngError> Chunk::parse(span<const uint8_t> bytes) {
    if (bytes.size() < OVERHEAD_SIZE) {
        return unexpected(PngError(PngErrorKind::UnexpectedEof,
            "At least 12 bytes needed to read a chunk, got " + to_string(bytes.size())));
    }

    uint32_t dataLength = readUint32BE(bytes.subspan(0, 4));

    array<uint8_t, 4> typeBytes;
    copy_n(bytes.begin() + 4, typeBytes.size(), typeBytes.begin());
    ChunkType chunkType = ChunkType::fromBytes(typeBytes);

    if (dataLength > MAX_DATA_LENGTH) {
        return unexpected(PngError(PngErrorKind::InvalidLength,
            "Declared chunk length " + to_string(dataLength) + " exceeds 2^31-1")
            .forChunk(chunkType.toString()));
    }

    if (bytes.size() - OVERHEAD_SIZE < dataLength) {
        return unexpected(PngError(PngErrorKind::UnexpectedEof,
            "Chunk declares " + to_string(dataLength) + " data bytes but only "
            + to_string(bytes.size() - OVERHEAD_SIZE) + " are available")
            .forChunk(chunkType.toString()));
    }

    span<const uint8_t> payload = bytes.subspan(8, dataLength);
    uint32_t storedCrc = readUint32BE(bytes.subspan(8 + dataLength, 4));

    Chunk chunk(chunkType, vector<uint8_t>(payload.begin(), payload.end()));
    if (chunk.crc() != storedCrc) {
        return unexpected(PngError(PngErrorKind::CrcMismatch,
            "CRC of chunk does not match calculated CRC (stored " + to_string(storedCrc)
            + ", computed " + to_string(chunk.crc()) + ")")
            .forChunk(chunkType.toString()));
    }

    // Checked after the CRC so corruption of the type bytes reads as CrcMismatch
    if (!chunkType.isValid()) {
        return unexpected(PngError(PngErrorKind::InvalidChunkType,
            "Invalid chunk type")
            .forChunk(chunkType.toString()));
    }

    return chunk;
}

expected<string, PngError> Chunk::dataAsString() const {
    if (!isValidUtf8(chunkData)) {
        return unexpected(PngError(PngErrorKind::InvalidUtf8,
            "Chunk data is not valid UTF-8")
            .forChunk(type.toString()));
    }
    return string(chunkData.begin(), chunkData.end());
}

vector<uint8_t> Chunk::asBytes() const {
    vector<uint8_t> out;
    out.reserve(wireSize());

    writeUint32BE(out, length());
    out.insert(out.end(), type.bytes().begin(), type.bytes().end());
    out.insert(out.end(), chunkData.begin(), chunkData.end());
    writeUint32BE(out, checksum);

    return out;
}

bool isValidUtf8(span<const uint8_t> bytes) {
    const char* begin = reinterpret_cast<const char*>(bytes.data());
    try {
        boost::locale::conv::utf_to_utf<char32_t>(begin, begin + bytes.size(), boost::locale::conv::stop);
    }
    catch (const boost::locale::conv::conversion_error&) {
        return false;
    }
    return true;
}

ostream& operator<<(ostream& os, const Chunk& chunk) {
    os << "Chunk {" << endl;
    os << "  Length: " << chunk.length() << endl;
    os << "  Type: " << chunk.chunkType() << endl;
    os << "  Data: " << chunk.data().size() << " bytes" << endl;
    os << "  Crc: " << chunk.crc() << endl;
    os << "}";
    return os;
}
