#include "MapGrid.h"

#include "core/AssetError.h"
#include "core/BinaryFile.h"
#include "core/Logging/Logging.h"
#include "formats/FormatConstants.h"

namespace FRLGRender {

MapGrid::MapGrid(uint32_t width, uint32_t height, std::vector<MapCell> cells, std::vector<MapCell> border)
    : width_(width), height_(height), cells_(std::move(cells)), border_(std::move(border)) {
    uint64_t expected = static_cast<uint64_t>(width_) * height_;
    if (cells_.size() != expected) {
        Log(WARNING, "MapGrid", "Grid is {}x{} ({} cells) but holds {} cells", width_, height_, expected, cells_.size());
    }
}

std::vector<MapCell> MapGrid::parseCells(const std::vector<uint8_t>& data, const std::string& source) {
    if (data.size() % kMapCellSize != 0) {
        throw FormatError(source + " has odd length " + std::to_string(data.size()));
    }

    std::vector<MapCell> cells(data.size() / kMapCellSize);
    for (size_t i = 0; i < cells.size(); ++i) {
        cells[i] = MapCell::fromU16(readLE16(data.data() + i * kMapCellSize));
    }
    return cells;
}

MapGrid MapGrid::loadFiles(uint32_t width, uint32_t height,
                           const std::string& mapPath, const std::string& borderPath) {
    auto cells = parseCells(readBinaryFile(mapPath), mapPath);
    auto border = parseCells(readBinaryFile(borderPath), borderPath);

    Log(DEBUG, "MapGrid", "Loaded {}x{} map from {} with {} border cells", width, height, mapPath, border.size());
    return MapGrid(width, height, std::move(cells), std::move(border));
}

std::optional<size_t> MapGrid::cellIndex(uint32_t row, uint32_t col) const {
    if (row >= height_ || col >= width_) {
        return std::nullopt;
    }
    size_t index = static_cast<size_t>(row) * width_ + col;
    if (index >= cells_.size()) {
        return std::nullopt;
    }
    return index;
}

std::optional<MapCell> MapGrid::getCell(uint32_t row, uint32_t col) const {
    auto index = cellIndex(row, col);
    if (!index) {
        return std::nullopt;
    }
    return cells_[*index];
}

bool MapGrid::setCell(uint32_t row, uint32_t col, const MapCell& cell) {
    auto index = cellIndex(row, col);
    if (!index) {
        return false;
    }
    cells_[*index] = cell;
    return true;
}

std::optional<MapCell> MapGrid::getBorderCell(size_t index) const {
    if (index >= border_.size()) {
        return std::nullopt;
    }
    return border_[index];
}

} // namespace FRLGRender
