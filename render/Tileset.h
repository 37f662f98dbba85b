#ifndef TILESET_H
#define TILESET_H

#include <string>
#include <vector>

#include "TileResolver.h"
#include "core/CommandRegistry.h"
#include "formats/METATILE/MetatileTable.h"
#include "formats/PAL/Palette.h"
#include "formats/PNG/Raster.h"
#include "formats/TILES/TileAtlas.h"

namespace FRLGRender {

/**
 * @class Tileset
 * One tileset directory of the decompilation: metatiles.bin,
 * metatile_attributes.bin, tiles.png and palettes/NN.pal.
 *
 * Metatiles hold tile ids and palette numbers only; the atlas and palettes
 * are owned here and shared read-only by every metatile.
 */
class Tileset : public TileResolver {
public:
    Tileset() = default;
    Tileset(MetatileTable metatiles, TileAtlas atlas, std::vector<Palette> palettes);

    // Fails fast with the IoError / FormatError of whichever file is bad.
    static Tileset load(const std::string& directory);

    // Throws RangeError when relativeId >= metatileCount().
    Raster renderMetatile(size_t relativeId) const;
    // Same, with tile ids and palette numbers answered by `resolver`.
    Raster renderMetatile(size_t relativeId, const TileResolver& resolver) const;

    std::optional<TilePixels> resolveTile(uint16_t rawTileId) const override;
    const Palette* resolvePalette(uint8_t paletteNumber) const override;

    size_t metatileCount() const { return metatiles_.size(); }
    const MetatileTable& metatiles() const { return metatiles_; }
    const TileAtlas& atlas() const { return atlas_; }
    const std::vector<Palette>& palettes() const { return palettes_; }

    static void registerCommands(CommandTable& commandTable);

private:
    MetatileTable metatiles_;
    TileAtlas atlas_;
    std::vector<Palette> palettes_;
};

} // namespace FRLGRender

#endif // TILESET_H
