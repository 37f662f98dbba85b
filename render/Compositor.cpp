#include "Compositor.h"

#include <iostream>
#include <limits>
#include <string>

#include "core/AssetError.h"
#include "core/CFG.h"
#include "core/Logging/Logging.h"
#include "formats/PNG/PNGCodec.h"

namespace FRLGRender {

namespace Compositor {

Raster render(const MapGrid& grid, const LayoutTileset& tileset) {
    const uint64_t widthPx = static_cast<uint64_t>(grid.width()) * kMetatileDimension;
    const uint64_t heightPx = static_cast<uint64_t>(grid.height()) * kMetatileDimension;
    if (widthPx > static_cast<uint64_t>(std::numeric_limits<int>::max()) ||
        heightPx > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw RangeError("Map of " + std::to_string(grid.width()) + "x" + std::to_string(grid.height()) +
                         " metatiles is too large to render");
    }
    Raster image(static_cast<int>(widthPx), static_cast<int>(heightPx));
    size_t unresolved = 0;

    for (uint32_t row = 0; row < grid.height(); ++row) {
        for (uint32_t col = 0; col < grid.width(); ++col) {
            auto cell = grid.getCell(row, col);
            if (!cell) {
                Log(ERROR, "Compositor", "No map cell at coordinate: ({}, {})", col, row);
                ++unresolved;
                continue;
            }
            Log(DEBUG, "Compositor", "Metatile id: {}", cell->metatileId);
            auto block = tileset.renderMetatile(cell->metatileId);
            if (!block) {
                Log(ERROR, "Compositor", "Failed to get metatile {} at coordinate: ({}, {})",
                    cell->metatileId, col, row);
                ++unresolved;
                continue;
            }
            image.blit(*block, static_cast<int>(col) * kMetatileDimension,
                       static_cast<int>(row) * kMetatileDimension);
        }
    }

    if (unresolved > 0) {
        Log(WARNING, "Compositor", "{} of {} cells left blank", unresolved,
            static_cast<uint64_t>(grid.width()) * grid.height());
    }
    return image;
}

Raster renderLayout(const LayoutDescriptor& descriptor) {
    Log(MESSAGE, "Compositor", "Rendering {} ({}x{}) with {} + {}", descriptor.id, descriptor.width,
        descriptor.height, descriptor.primaryTilesetPath, descriptor.secondaryTilesetPath);

    MapGrid grid = MapGrid::loadFiles(descriptor.width, descriptor.height,
                                      descriptor.mapFilePath, descriptor.borderFilePath);
    LayoutTileset tileset = LayoutTileset::load(descriptor.primaryTilesetPath,
                                                descriptor.secondaryTilesetPath);
    return render(grid, tileset);
}

void registerCommands(CommandTable& commandTable) {
    commandTable["layout"].actions["render"] = {
        "Render a layout to PNG (e.g., layout render LAYOUT_POWER_PLANT /tmp/render.png); "
        "defaults come from DefaultLayout and OutputPath",
        [](const std::vector<std::string>& args) -> int {
            return runCommand("Compositor", [&]() {
                std::string layoutId = args.size() > 0 ? args[0] : FRLG_CFG.DefaultLayout;
                std::string output = args.size() > 1 ? args[1] : FRLG_CFG.OutputPath;

                LayoutTable table = LayoutTable::load(FRLG_CFG.getLayoutsFilePath());
                auto entry = table.find(layoutId);
                if (!entry) {
                    Log(ERROR, "Compositor", "No layout matching name {} found", layoutId);
                    return 1;
                }
                Raster image = renderLayout(LayoutTable::resolve(*entry, FRLG_CFG.getRootPath()));
                PNGCodec::save(output, image);
                Log(MESSAGE, "Compositor", "Wrote {}x{} image to {}", image.width, image.height, output);
                return 0;
            });
        }
    };

    auto& command = commandTable["map"];
    command.help = "Map grids given by explicit paths";

    command.actions["render"] = {
        "Render a map without layouts.json "
        "(e.g., map render 20 15 <primary_dir> <secondary_dir> map.bin border.bin out.png)",
        [](const std::vector<std::string>& args) -> int {
            if (args.size() < 7) {
                std::cerr << "Usage: map render <width> <height> <primary_dir> <secondary_dir> "
                             "<map.bin> <border.bin> <output.png>" << std::endl;
                return 1;
            }
            return runCommand("Compositor", [&]() {
                LayoutDescriptor descriptor;
                descriptor.id = args[4];
                descriptor.width = static_cast<uint32_t>(parseNumberArgument(args[0], "width"));
                descriptor.height = static_cast<uint32_t>(parseNumberArgument(args[1], "height"));
                descriptor.primaryTilesetPath = args[2];
                descriptor.secondaryTilesetPath = args[3];
                descriptor.mapFilePath = args[4];
                descriptor.borderFilePath = args[5];

                Raster image = renderLayout(descriptor);
                PNGCodec::save(args[6], image);
                Log(MESSAGE, "Compositor", "Wrote {}x{} image to {}", image.width, image.height, args[6]);
                return 0;
            });
        }
    };

    command.actions["cell"] = {
        "Print one map cell (e.g., map cell 20 15 map.bin border.bin 3 7)",
        [](const std::vector<std::string>& args) -> int {
            if (args.size() < 6) {
                std::cerr << "Usage: map cell <width> <height> <map.bin> <border.bin> <row> <col>" << std::endl;
                return 1;
            }
            return runCommand("Compositor", [&]() {
                auto width = static_cast<uint32_t>(parseNumberArgument(args[0], "width"));
                auto height = static_cast<uint32_t>(parseNumberArgument(args[1], "height"));
                auto row = static_cast<uint32_t>(parseNumberArgument(args[4], "row"));
                auto col = static_cast<uint32_t>(parseNumberArgument(args[5], "col"));

                MapGrid grid = MapGrid::loadFiles(width, height, args[2], args[3]);
                auto cell = grid.getCell(row, col);
                if (!cell) {
                    Log(ERROR, "Compositor", "({}, {}) is outside the {}x{} map", row, col, width, height);
                    return 1;
                }
                std::cout << "metatile:  " << cell->metatileId << "\n"
                          << "collision: " << static_cast<int>(cell->collision) << "\n"
                          << "elevation: " << static_cast<int>(cell->elevation) << std::endl;
                return 0;
            });
        }
    };
}

} // namespace Compositor

} // namespace FRLGRender
