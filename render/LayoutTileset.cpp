#include "LayoutTileset.h"

#include "core/Logging/Logging.h"

namespace FRLGRender {

namespace {

// Tile ids split at the fixed primary tile budget; palettes come from the
// tileset that owns the metatile being drawn.
class SplitTileResolver : public TileResolver {
public:
    SplitTileResolver(const Tileset& primary, const Tileset& secondary, const Tileset& owner)
        : primary_(primary), secondary_(secondary), owner_(owner) {}

    std::optional<TilePixels> resolveTile(uint16_t rawTileId) const override {
        if (rawTileId < kPrimaryTileCount) {
            return primary_.atlas().getTile(rawTileId);
        }
        return secondary_.atlas().getTile(rawTileId - kPrimaryTileCount);
    }

    const Palette* resolvePalette(uint8_t paletteNumber) const override {
        return owner_.resolvePalette(paletteNumber);
    }

private:
    const Tileset& primary_;
    const Tileset& secondary_;
    const Tileset& owner_;
};

} // namespace

LayoutTileset::LayoutTileset(Tileset primary, Tileset secondary)
    : primary_(std::move(primary)), secondary_(std::move(secondary)) {}

LayoutTileset LayoutTileset::load(const std::string& primaryDir, const std::string& secondaryDir) {
    Tileset primary = Tileset::load(primaryDir);
    Tileset secondary = Tileset::load(secondaryDir);
    if (primary.atlas().tileCount() > kPrimaryTileCount) {
        Log(WARNING, "LayoutTileset", "{} holds {} tiles, only the first {} are addressable",
            primaryDir, primary.atlas().tileCount(), kPrimaryTileCount);
    }
    return LayoutTileset(std::move(primary), std::move(secondary));
}

std::optional<Raster> LayoutTileset::renderMetatile(uint32_t globalId) const {
    const size_t split = primary_.metatileCount();
    if (globalId < split) {
        return primary_.renderMetatile(globalId, SplitTileResolver(primary_, secondary_, primary_));
    }
    const size_t relativeId = globalId - split;
    if (relativeId < secondary_.metatileCount()) {
        return secondary_.renderMetatile(relativeId, SplitTileResolver(primary_, secondary_, secondary_));
    }
    return std::nullopt;
}

} // namespace FRLGRender
