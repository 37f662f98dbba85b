#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FRLGRender {

// Whole file into memory. Throws IoError when the file is missing or unreadable.
std::vector<uint8_t> readBinaryFile(const std::string& path);

// Asset files are little-endian regardless of host.
inline uint16_t readLE16(const uint8_t* data) {
    return static_cast<uint16_t>(data[0] | (data[1] << 8));
}

inline uint32_t readLE32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

inline void writeLE16(uint8_t* data, uint16_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>(value >> 8);
}

inline void writeLE32(uint8_t* data, uint32_t value) {
    data[0] = static_cast<uint8_t>(value & 0xFF);
    data[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[3] = static_cast<uint8_t>(value >> 24);
}

} // namespace FRLGRender
