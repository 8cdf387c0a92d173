#ifndef PNG_ERROR_HPP
#define PNG_ERROR_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

enum class PngErrorKind : uint8_t {
    InvalidSignature = 1,
    UnexpectedEof,
    CrcMismatch,
    InvalidChunkType,
    TrailingBytes,
    ChunkNotFound,
    InvalidUtf8,
    InvalidLength,
    IoError,
    EncodingFailed
};

/**
 * @brief Typed failure returned by every fallible pngme operation.
 *
 * Carries the error kind, a human readable message and, where the failure
 * happened inside a file, the byte offset and the chunk type involved.
 */
struct PngError {
    PngErrorKind kind;
    std::string message;
    std::optional<uint64_t> offset;
    std::optional<std::string> chunkType;

    PngError(PngErrorKind kind, std::string message)
        : kind(kind), message(std::move(message)) {}

    PngError& atOffset(uint64_t position) { offset = position; return *this; }
    PngError& forChunk(std::string type) { chunkType = std::move(type); return *this; }

    std::string toString() const;
};

// Converts PngErrorKind to its name, e.g. "CrcMismatch"
std::string error_kind_to_string(PngErrorKind kind);

// Distinct nonzero process exit code per error kind
int error_kind_exit_code(PngErrorKind kind);

std::ostream& operator<<(std::ostream& os, PngErrorKind kind);
std::ostream& operator<<(std::ostream& os, const PngError& error);

#endif
