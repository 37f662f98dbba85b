#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "formats/METATILE/MetatileV1.hpp"
#include "formats/PAL/Palette.h"
#include "formats/PNG/Raster.h"
#include "formats/TILES/TileAtlas.h"

namespace FRLGRender::test {

// Fresh directory under the system temp dir, removed with everything in it on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& data);
void writeText(const std::filesystem::path& path, const std::string& text);

// JASC-PAL text whose entry i is `colors[i]`.
std::string jascPalette(const std::array<Color, kPaletteSize>& colors);
// Entry 0 black, every other entry `color`.
std::array<Color, kPaletteSize> solidColors(Color color);

// Unpacked 4-bit indices of a tileWidth x tileHeight sheet, row-major by pixel.
struct AtlasPixels {
    size_t tileWidth = 0;
    size_t tileHeight = 0;
    std::vector<uint8_t> indices;

    AtlasPixels(size_t tileWidth, size_t tileHeight);
    size_t widthPx() const { return tileWidth * kTileDimension; }
    size_t heightPx() const { return tileHeight * kTileDimension; }
    void setTile(size_t tileId, const TilePixels& pixels);
    void fillTile(size_t tileId, uint8_t index);
    // Two pixels per byte, even column in the high nibble.
    std::vector<uint8_t> packed() const;
};

TilePixels uniformTile(uint8_t index);

// Palette-type PNG with 16 grey entries at the given bit depth; `packedRows` holds height rows.
void writePalettePNG(const std::string& path, int width, int height, int bitDepth,
                     const std::vector<uint8_t>& packedRows);
void writeAtlasPNG(const std::string& path, const AtlasPixels& atlas);
void writeRGBAPNG(const std::string& path, int width, int height);
// Decodes any PNG to ARGB.
Raster readPNG(const std::string& path);

Metatile makeMetatile(const std::array<TileRef, kTilesPerMetatile>& tiles,
                      LayerType layerType = LayerType::MiddleTop);
TileRef ref(uint16_t tileId, uint8_t palette = 0, bool hflip = false, bool vflip = false);

// Writes metatiles.bin, metatile_attributes.bin, tiles.png and palettes/NN.pal under `dir`.
void writeTileset(const std::filesystem::path& dir, const std::vector<Metatile>& metatiles,
                  const AtlasPixels& atlas, const std::vector<std::array<Color, kPaletteSize>>& palettes);

std::vector<uint8_t> mapBytes(const std::vector<uint16_t>& cells);

uint32_t argb(const Color& color);

} // namespace FRLGRender::test
