#include "byteOrder.hpp"

#include <stdexcept>

using namespace std;

uint32_t readUint32BE(span<const uint8_t> bytes) {
    if (bytes.size() < sizeof(uint32_t)) {
        throw out_of_range("readUint32BE needs 4 bytes");
    }
    return (static_cast<uint32_t>(bytes[0]) << 24)
         | (static_cast<uint32_t>(bytes[1]) << 16)
         | (static_cast<uint32_t>(bytes[2]) << 8)
         |  static_cast<uint32_t>(bytes[3]);
}

void writeUint32BE(vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}
