#include "Tileset.h"

#include <filesystem>
#include <iostream>

#include "core/AssetError.h"
#include "core/Logging/Logging.h"
#include "formats/PNG/PNGCodec.h"

namespace fs = std::filesystem;

namespace FRLGRender {

Tileset::Tileset(MetatileTable metatiles, TileAtlas atlas, std::vector<Palette> palettes)
    : metatiles_(std::move(metatiles)), atlas_(std::move(atlas)), palettes_(std::move(palettes)) {}

Tileset Tileset::load(const std::string& directory) {
    fs::path dir(directory);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw IoError("Tileset directory not found: " + directory);
    }

    Log(DEBUG, "Tileset", "Loading tileset from {}", directory);

    MetatileTable metatiles = MetatileTable::loadFiles((dir / "metatiles.bin").string(),
                                                       (dir / "metatile_attributes.bin").string());
    TileAtlas atlas = TileAtlas::loadPNG((dir / "tiles.png").string());
    std::vector<Palette> palettes = PaletteStore::loadDirectory((dir / "palettes").string());

    Log(MESSAGE, "Tileset", "{}: {} metatiles, {} tiles, {} palettes",
        directory, metatiles.size(), atlas.tileCount(), palettes.size());
    return Tileset(std::move(metatiles), std::move(atlas), std::move(palettes));
}

std::optional<TilePixels> Tileset::resolveTile(uint16_t rawTileId) const {
    return atlas_.getTile(rawTileId);
}

const Palette* Tileset::resolvePalette(uint8_t paletteNumber) const {
    if (paletteNumber >= palettes_.size()) {
        return nullptr;
    }
    return &palettes_[paletteNumber];
}

Raster Tileset::renderMetatile(size_t relativeId) const {
    return renderMetatile(relativeId, *this);
}

Raster Tileset::renderMetatile(size_t relativeId, const TileResolver& resolver) const {
    const Metatile& metatile = metatiles_.at(relativeId);
    Raster block(kMetatileDimension, kMetatileDimension);

    for (int layer = 0; layer < 2; ++layer) {
        // Index 0 of the top layer lets the bottom layer show through
        const bool overlay = layer == 1;

        for (int row = 0; row < 2; ++row) {
            for (int col = 0; col < 2; ++col) {
                const TileRef& ref = metatile.tile(layer, row, col);

                auto pixels = resolver.resolveTile(ref.tileId);
                if (!pixels) {
                    Log(WARNING, "Tileset", "Metatile {}: tile {} (layer {}, {},{}) is out of range, skipped",
                        relativeId, ref.tileId, layer, row, col);
                    continue;
                }
                const Palette* palette = resolver.resolvePalette(ref.paletteNumber);
                if (!palette) {
                    Log(WARNING, "Tileset", "Metatile {}: palette {} (layer {}, {},{}) is not loaded, skipped",
                        relativeId, ref.paletteNumber, layer, row, col);
                    continue;
                }

                for (int py = 0; py < kTileDimension; ++py) {
                    int srcRow = ref.flipVertical ? kTileDimension - 1 - py : py;
                    for (int px = 0; px < kTileDimension; ++px) {
                        int srcCol = ref.flipHorizontal ? kTileDimension - 1 - px : px;
                        uint8_t index = (*pixels)[srcRow][srcCol];
                        if (overlay && index == 0) {
                            continue;
                        }
                        const Color& color = palette->get(index);
                        block.set(col * kTileDimension + px, row * kTileDimension + py,
                                  makeARGB(color.r, color.g, color.b));
                    }
                }
            }
        }
    }

    return block;
}

void Tileset::registerCommands(CommandTable& commandTable) {
    auto& command = commandTable["tileset"];
    command.help = "Single tileset inspection";

    command.actions["info"] = {
        "Print metatile, tile and palette counts (e.g., tileset info data/tilesets/primary/general)",
        [](const std::vector<std::string>& args) -> int {
            if (args.empty()) {
                std::cerr << "Usage: tileset info <tileset_dir>" << std::endl;
                return 1;
            }
            return runCommand("Tileset", [&]() {
                Tileset tileset = Tileset::load(args[0]);
                std::cout << "metatiles: " << tileset.metatileCount() << "\n"
                          << "tiles:     " << tileset.atlas().tileCount() << " ("
                          << tileset.atlas().tileWidth() << "x" << tileset.atlas().tileHeight() << ")\n"
                          << "palettes:  " << tileset.palettes().size() << std::endl;
                return 0;
            });
        }
    };

    command.actions["metatile"] = {
        "Render one metatile to a 16x16 PNG (e.g., tileset metatile <tileset_dir> 12 out.png)",
        [](const std::vector<std::string>& args) -> int {
            if (args.size() < 3) {
                std::cerr << "Usage: tileset metatile <tileset_dir> <metatile_id> <output.png>" << std::endl;
                return 1;
            }
            return runCommand("Tileset", [&]() {
                Tileset tileset = Tileset::load(args[0]);
                size_t id = parseNumberArgument(args[1], "metatile_id");
                Raster block = tileset.renderMetatile(id);
                PNGCodec::save(args[2], block);
                Log(MESSAGE, "Tileset", "Wrote metatile {} to {}", id, args[2]);
                return 0;
            });
        }
    };
}

} // namespace FRLGRender
