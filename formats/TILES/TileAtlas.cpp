#include "TileAtlas.h"

#include "core/AssetError.h"
#include "core/Logging/Logging.h"
#include "formats/PNG/PNGCodec.h"

namespace FRLGRender {

namespace {
constexpr size_t kPixelsPerByte = 2;
}

TileAtlas::TileAtlas(std::vector<uint8_t> packed, size_t tileWidth, size_t tileHeight)
    : packed_(std::move(packed)), tileWidth_(tileWidth), tileHeight_(tileHeight) {
    size_t expected = widthPx() * heightPx() / kPixelsPerByte;
    if (packed_.size() != expected) {
        throw FormatError("Tile atlas holds " + std::to_string(packed_.size()) + " bytes, expected " +
                          std::to_string(expected) + " for " + std::to_string(tileWidth_) + "x" +
                          std::to_string(tileHeight_) + " tiles");
    }
}

TileAtlas TileAtlas::loadPNG(const std::string& path) {
    PackedIndexedImage image = PNGCodec::readIndexed4(path);

    size_t tileWidth = static_cast<size_t>(image.width) / kTileDimension;
    size_t tileHeight = static_cast<size_t>(image.height) / kTileDimension;
    Log(DEBUG, "TileAtlas", "{}: {}x{} tiles", path, tileWidth, tileHeight);

    return TileAtlas(std::move(image.packed), tileWidth, tileHeight);
}

std::optional<TilePixels> TileAtlas::getTile(size_t tileId) const {
    if (tileId >= tileCount()) {
        return std::nullopt;
    }

    size_t tileX = tileId % tileWidth_;
    size_t tileY = tileId / tileWidth_;
    size_t atlasWidthPx = widthPx();

    TilePixels tile{};
    for (int row = 0; row < kTileDimension; ++row) {
        size_t pixelY = tileY * kTileDimension + row;
        for (int col = 0; col < kTileDimension; ++col) {
            size_t pixelX = tileX * kTileDimension + col;
            uint8_t packed = packed_[(pixelY * atlasWidthPx + pixelX) / kPixelsPerByte];
            // High nibble holds the even column
            tile[row][col] = (pixelX % 2 == 0) ? (packed >> 4) : (packed & 0x0F);
        }
    }
    return tile;
}

} // namespace FRLGRender
