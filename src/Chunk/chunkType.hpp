#ifndef CHUNK_TYPE_HPP
#define CHUNK_TYPE_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <ostream>
#include <string>

#include "Utility/pngError.hpp"

/**
 * @brief Four byte PNG chunk type code.
 *
 * Bit 5 of each byte carries a property: ancillary, private, reserved and
 * safe-to-copy respectively. Any four bytes can be stored; isValid() tells
 * whether they form a legal type.
 */
class ChunkType {
private:
    static constexpr uint8_t PROPERTY_BIT = 0x20;

    std::array<uint8_t, 4> typeBytes;

    explicit ChunkType(const std::array<uint8_t, 4>& bytes) : typeBytes(bytes) {}

    bool propertyBitSet(size_t index) const { return (typeBytes[index] & PROPERTY_BIT) != 0; }

public:
    static ChunkType fromBytes(const std::array<uint8_t, 4>& bytes) { return ChunkType(bytes); }

    /**
     * @brief Build a chunk type from its textual form, e.g. "ruSt".
     *
     * @return InvalidChunkType if the string is not exactly four ASCII letters.
     *         A reserved-bit violation is accepted here and reported by isValid().
     */
    static std::expected<ChunkType, PngError> fromString(const std::string& str);

    static bool isTypeByte(uint8_t byte);

    bool isCritical() const { return !propertyBitSet(0); }
    bool isPublic() const { return !propertyBitSet(1); }
    bool isReservedBitValid() const { return !propertyBitSet(2); }
    bool isSafeToCopy() const { return propertyBitSet(3); }

    bool isValid() const;

    const std::array<uint8_t, 4>& bytes() const { return typeBytes; }
    std::string toString() const;

    friend bool operator==(const ChunkType& lhs, const ChunkType& rhs) {
        return lhs.typeBytes == rhs.typeBytes;
    }

    friend bool operator!=(const ChunkType& lhs, const ChunkType& rhs) {
        return !(lhs == rhs);
    }
};

std::ostream& operator<<(std::ostream& os, const ChunkType& type);

#endif
