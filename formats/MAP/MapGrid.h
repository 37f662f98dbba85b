#ifndef MAP_GRID_H
#define MAP_GRID_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "MapCell.hpp"

namespace FRLGRender {

/**
 * @class MapGrid
 * Row-major metatile grid of one layout plus its border block. The map files
 * carry no dimensions; width and height come from the layout table.
 */
class MapGrid {
public:
    MapGrid() = default;
    // Logs a warning when cells.size() != width*height; lookups past the buffer answer nullopt.
    MapGrid(uint32_t width, uint32_t height, std::vector<MapCell> cells, std::vector<MapCell> border);

    // Throws FormatError on odd lengths.
    static std::vector<MapCell> parseCells(const std::vector<uint8_t>& data, const std::string& source);
    // Throws IoError for missing files and FormatError on odd lengths. A cell
    // count that disagrees with width*height is logged, not fatal.
    static MapGrid loadFiles(uint32_t width, uint32_t height,
                             const std::string& mapPath, const std::string& borderPath);

    std::optional<MapCell> getCell(uint32_t row, uint32_t col) const;
    bool setCell(uint32_t row, uint32_t col, const MapCell& cell);
    std::optional<MapCell> getBorderCell(size_t index) const;

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    const std::vector<MapCell>& cells() const { return cells_; }
    const std::vector<MapCell>& border() const { return border_; }

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<MapCell> cells_;
    std::vector<MapCell> border_;

    std::optional<size_t> cellIndex(uint32_t row, uint32_t col) const;
};

} // namespace FRLGRender

#endif // MAP_GRID_H
