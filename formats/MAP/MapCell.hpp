#pragma once

#include <cstdint>

namespace FRLGRender {

// One entry of a map.bin / border.bin (little-endian u16):
//   bits 0-9   metatile id
//   bits 10-11 collision
//   bits 12-15 elevation
struct MapCell {
    uint16_t metatileId = 0;
    uint8_t collision = 0;
    uint8_t elevation = 0;

    static MapCell fromU16(uint16_t value) {
        MapCell cell;
        cell.metatileId = value & 0x03FF;
        cell.collision = static_cast<uint8_t>((value & 0x0C00) >> 10);
        cell.elevation = static_cast<uint8_t>((value & 0xF000) >> 12);
        return cell;
    }

    uint16_t toU16() const {
        return static_cast<uint16_t>((metatileId & 0x03FF) | ((collision & 0x3) << 10) | ((elevation & 0xF) << 12));
    }

    bool operator==(const MapCell& other) const = default;
};

} // namespace FRLGRender
