#ifndef BYTE_ORDER_HPP
#define BYTE_ORDER_HPP

#include <cstdint>
#include <span>
#include <vector>

// PNG stores every multi-byte integer in network (big-endian) order

uint32_t readUint32BE(std::span<const uint8_t> bytes);
void writeUint32BE(std::vector<uint8_t>& out, uint32_t value);

#endif
