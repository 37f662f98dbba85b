#ifndef TILE_ATLAS_H
#define TILE_ATLAS_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "formats/FormatConstants.h"

namespace FRLGRender {

// 8x8 palette indices, [row][col]
using TilePixels = std::array<std::array<uint8_t, kTileDimension>, kTileDimension>;

/**
 * @class TileAtlas
 * The tiles.png sheet of a tileset, kept as packed 4-bit data. Tiles are
 * numbered row-major across the sheet and unpacked only when asked for.
 */
class TileAtlas {
public:
    TileAtlas() = default;
    // packed.size() must equal tileWidth*8 * tileHeight*8 / 2; throws FormatError otherwise.
    TileAtlas(std::vector<uint8_t> packed, size_t tileWidth, size_t tileHeight);

    // Throws IoError / FormatError, see PNGCodec::readIndexed4.
    static TileAtlas loadPNG(const std::string& path);

    std::optional<TilePixels> getTile(size_t tileId) const;

    size_t tileWidth() const { return tileWidth_; }
    size_t tileHeight() const { return tileHeight_; }
    size_t tileCount() const { return tileWidth_ * tileHeight_; }
    size_t widthPx() const { return tileWidth_ * kTileDimension; }
    size_t heightPx() const { return tileHeight_ * kTileDimension; }

private:
    std::vector<uint8_t> packed_;
    size_t tileWidth_ = 0;
    size_t tileHeight_ = 0;
};

} // namespace FRLGRender

#endif // TILE_ATLAS_H
