#ifndef LAYOUT_TILESET_H
#define LAYOUT_TILESET_H

#include <cstdint>
#include <optional>
#include <string>

#include "Tileset.h"

namespace FRLGRender {

/**
 * @class LayoutTileset
 * The primary/secondary tileset pair of one layout, addressed by the global
 * metatile ids stored in map cells.
 *
 * Metatile ids below primary.metatileCount() belong to the primary tileset,
 * the rest to the secondary one. Tile ids inside any metatile are split at
 * kPrimaryTileCount instead, independent of the metatile split.
 */
class LayoutTileset {
public:
    LayoutTileset() = default;
    LayoutTileset(Tileset primary, Tileset secondary);

    static LayoutTileset load(const std::string& primaryDir, const std::string& secondaryDir);

    // nullopt when globalId >= metatileCount()
    std::optional<Raster> renderMetatile(uint32_t globalId) const;

    size_t primaryCount() const { return primary_.metatileCount(); }
    size_t metatileCount() const { return primary_.metatileCount() + secondary_.metatileCount(); }
    const Tileset& primary() const { return primary_; }
    const Tileset& secondary() const { return secondary_; }

private:
    Tileset primary_;
    Tileset secondary_;
};

} // namespace FRLGRender

#endif // LAYOUT_TILESET_H
