#include "pngError.hpp"

#include <string>
#include <sstream>
#include <iostream>

using namespace std;

string error_kind_to_string(PngErrorKind kind) {
    switch (kind) {
        case PngErrorKind::InvalidSignature: return "InvalidSignature";
        case PngErrorKind::UnexpectedEof:    return "UnexpectedEof";
        case PngErrorKind::CrcMismatch:      return "CrcMismatch";
        case PngErrorKind::InvalidChunkType: return "InvalidChunkType";
        case PngErrorKind::TrailingBytes:    return "TrailingBytes";
        case PngErrorKind::ChunkNotFound:    return "ChunkNotFound";
        case PngErrorKind::InvalidUtf8:      return "InvalidUtf8";
        case PngErrorKind::InvalidLength:    return "InvalidLength";
        case PngErrorKind::IoError:          return "IoError";
        case PngErrorKind::EncodingFailed:   return "EncodingFailed";
        default:                             return "Unknown";
    }
}

int error_kind_exit_code(PngErrorKind kind) {
    // Exit code 1 is left to CLI11 for usage errors
    return static_cast<int>(kind) + 1;
}

string PngError::toString() const {
    ostringstream oss;
    oss << message;
    if (chunkType) {
        oss << " (chunk " << *chunkType;
        if (offset) oss << " at offset " << *offset;
        oss << ")";
    }
    else if (offset) {
        oss << " (at offset " << *offset << ")";
    }
    return oss.str();
}

ostream& operator<<(ostream& os, PngErrorKind kind) {
    return os << error_kind_to_string(kind);
}

ostream& operator<<(ostream& os, const PngError& error) {
    return os << "[" << error.kind << "] " << error.toString();
}
