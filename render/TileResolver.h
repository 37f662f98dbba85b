#pragma once

#include <cstdint>
#include <optional>

#include "formats/PAL/Palette.h"
#include "formats/TILES/TileAtlas.h"

namespace FRLGRender {

// Where the tile ids and palette numbers of a metatile point to. A standalone
// tileset answers from its own atlas; a layout splits ids between two atlases.
class TileResolver {
public:
    virtual ~TileResolver() = default;

    virtual std::optional<TilePixels> resolveTile(uint16_t rawTileId) const = 0;
    // nullptr when the palette number is not loaded
    virtual const Palette* resolvePalette(uint8_t paletteNumber) const = 0;
};

} // namespace FRLGRender
