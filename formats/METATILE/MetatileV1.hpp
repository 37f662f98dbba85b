#ifndef METATILEV1_HPP
#define METATILEV1_HPP

#include <array>
#include <cstdint>

#include "formats/FormatConstants.h"

namespace FRLGRender {

// One entry of metatiles.bin (little-endian u16):
//   bits 0-9   tile id
//   bit  10    horizontal flip
//   bit  11    vertical flip
//   bits 12-15 palette number
struct TileRef {
    uint16_t tileId = 0;
    bool flipHorizontal = false;
    bool flipVertical = false;
    uint8_t paletteNumber = 0;

    static TileRef fromU16(uint16_t value) {
        TileRef ref;
        ref.tileId = value & 0x03FF;
        ref.flipHorizontal = (value & 0x0400) != 0;
        ref.flipVertical = (value & 0x0800) != 0;
        ref.paletteNumber = static_cast<uint8_t>((value & 0xF000) >> 12);
        return ref;
    }

    uint16_t toU16() const {
        return static_cast<uint16_t>((tileId & 0x03FF) |
                                     (flipHorizontal ? 0x0400 : 0) |
                                     (flipVertical ? 0x0800 : 0) |
                                     ((paletteNumber & 0x0F) << 12));
    }

    bool operator==(const TileRef& other) const = default;
};

enum class LayerType : uint8_t {
    MiddleTop = 0,
    BottomMiddle = 1,
    BottomTop = 2,
};

inline const char* layerTypeName(LayerType type) {
    switch (type) {
        case LayerType::MiddleTop: return "MiddleTop";
        case LayerType::BottomMiddle: return "BottomMiddle";
        case LayerType::BottomTop: return "BottomTop";
    }
    return "MiddleTop";
}

// One entry of metatile_attributes.bin (little-endian u32). Only the layer
// type in bits 29-30 is decoded; the behaviour bits are kept raw.
struct MetatileAttributes {
    LayerType layerType = LayerType::MiddleTop;
    uint32_t raw = 0;

    // Bit pattern 3 has no layer type and falls back to MiddleTop.
    static MetatileAttributes fromU32(uint32_t value) {
        MetatileAttributes attributes;
        attributes.raw = value;
        switch ((value >> 29) & 0x3) {
            case 1: attributes.layerType = LayerType::BottomMiddle; break;
            case 2: attributes.layerType = LayerType::BottomTop; break;
            default: attributes.layerType = LayerType::MiddleTop; break;
        }
        return attributes;
    }

    uint32_t toU32() const {
        return (raw & ~(0x3u << 29)) | (static_cast<uint32_t>(layerType) << 29);
    }
};

// Tiles 0-3 form the bottom layer, 4-7 the top layer, each a row-major 2x2 grid.
struct Metatile {
    std::array<TileRef, kTilesPerMetatile> tiles{};
    MetatileAttributes attributes;

    const TileRef& tile(int layer, int row, int col) const {
        return tiles[layer * kTilesPerLayer + row * 2 + col];
    }
};

} // namespace FRLGRender

#endif // METATILEV1_HPP
