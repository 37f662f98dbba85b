#include "Fixtures.h"

#include <atomic>
#include <chrono>
#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <png.h>

#include "core/BinaryFile.h"
#include "formats/METATILE/MetatileTable.h"

namespace fs = std::filesystem;

namespace FRLGRender::test {

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("frlgrender_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void writeBytes(const fs::path& path, const std::vector<uint8_t>& data) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void writeText(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

std::string jascPalette(const std::array<Color, kPaletteSize>& colors) {
    std::ostringstream out;
    out << "JASC-PAL\n0100\n16\n";
    for (const auto& c : colors) {
        out << static_cast<int>(c.r) << " " << static_cast<int>(c.g) << " " << static_cast<int>(c.b) << "\n";
    }
    return out.str();
}

std::array<Color, kPaletteSize> solidColors(Color color) {
    std::array<Color, kPaletteSize> colors{};
    for (size_t i = 1; i < colors.size(); ++i) {
        colors[i] = color;
    }
    return colors;
}

AtlasPixels::AtlasPixels(size_t tileWidth, size_t tileHeight)
    : tileWidth(tileWidth), tileHeight(tileHeight),
      indices(tileWidth * kTileDimension * tileHeight * kTileDimension, 0) {}

void AtlasPixels::setTile(size_t tileId, const TilePixels& pixels) {
    size_t tileX = tileId % tileWidth;
    size_t tileY = tileId / tileWidth;
    for (int row = 0; row < kTileDimension; ++row) {
        for (int col = 0; col < kTileDimension; ++col) {
            size_t x = tileX * kTileDimension + col;
            size_t y = tileY * kTileDimension + row;
            indices[y * widthPx() + x] = pixels[row][col];
        }
    }
}

void AtlasPixels::fillTile(size_t tileId, uint8_t index) {
    setTile(tileId, uniformTile(index));
}

std::vector<uint8_t> AtlasPixels::packed() const {
    std::vector<uint8_t> out(indices.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(((indices[2 * i] & 0x0F) << 4) | (indices[2 * i + 1] & 0x0F));
    }
    return out;
}

TilePixels uniformTile(uint8_t index) {
    TilePixels tile{};
    for (auto& row : tile) {
        row.fill(index);
    }
    return tile;
}

void writePalettePNG(const std::string& path, int width, int height, int bitDepth,
                     const std::vector<uint8_t>& packedRows) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        throw std::runtime_error("cannot create " + path);
    }
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    png_infop info = png_create_info_struct(png);
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        fclose(file);
        throw std::runtime_error("libpng failed writing " + path);
    }
    png_init_io(png, file);
    png_set_IHDR(png, info, width, height, bitDepth, PNG_COLOR_TYPE_PALETTE, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_color palette[16];
    for (int i = 0; i < 16; ++i) {
        palette[i].red = palette[i].green = palette[i].blue = static_cast<png_byte>(i * 17);
    }
    png_set_PLTE(png, info, palette, 16);
    png_write_info(png, info);

    size_t rowBytes = packedRows.size() / static_cast<size_t>(height);
    for (int y = 0; y < height; ++y) {
        png_write_row(png, packedRows.data() + static_cast<size_t>(y) * rowBytes);
    }
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    fclose(file);
}

void writeAtlasPNG(const std::string& path, const AtlasPixels& atlas) {
    writePalettePNG(path, static_cast<int>(atlas.widthPx()), static_cast<int>(atlas.heightPx()), 4,
                    atlas.packed());
}

void writeRGBAPNG(const std::string& path, int width, int height) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    image.width = static_cast<png_uint_32>(width);
    image.height = static_cast<png_uint_32>(height);
    image.format = PNG_FORMAT_RGBA;
    std::vector<uint8_t> buffer(PNG_IMAGE_SIZE(image), 0x80);
    if (!png_image_write_to_file(&image, path.c_str(), 0, buffer.data(), 0, nullptr)) {
        throw std::runtime_error("cannot write " + path);
    }
}

Raster readPNG(const std::string& path) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.c_str())) {
        throw std::runtime_error("cannot read " + path);
    }
    image.format = PNG_FORMAT_RGBA;
    std::vector<uint8_t> buffer(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, buffer.data(), 0, nullptr)) {
        png_image_free(&image);
        throw std::runtime_error("cannot decode " + path);
    }

    Raster raster(static_cast<int>(image.width), static_cast<int>(image.height));
    for (size_t i = 0; i < raster.pixels.size(); ++i) {
        raster.pixels[i] = makeARGB(buffer[i * 4], buffer[i * 4 + 1], buffer[i * 4 + 2], buffer[i * 4 + 3]);
    }
    return raster;
}

Metatile makeMetatile(const std::array<TileRef, kTilesPerMetatile>& tiles, LayerType layerType) {
    Metatile metatile;
    metatile.tiles = tiles;
    metatile.attributes.layerType = layerType;
    metatile.attributes.raw = static_cast<uint32_t>(layerType) << 29;
    return metatile;
}

TileRef ref(uint16_t tileId, uint8_t palette, bool hflip, bool vflip) {
    TileRef tileRef;
    tileRef.tileId = tileId;
    tileRef.paletteNumber = palette;
    tileRef.flipHorizontal = hflip;
    tileRef.flipVertical = vflip;
    return tileRef;
}

void writeTileset(const fs::path& dir, const std::vector<Metatile>& metatiles,
                  const AtlasPixels& atlas, const std::vector<std::array<Color, kPaletteSize>>& palettes) {
    fs::create_directories(dir / "palettes");
    MetatileTable table(metatiles);
    writeBytes(dir / "metatiles.bin", table.serializeMetatiles());
    writeBytes(dir / "metatile_attributes.bin", table.serializeAttributes());
    writeAtlasPNG((dir / "tiles.png").string(), atlas);
    for (size_t i = 0; i < palettes.size(); ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "%02zu.pal", i);
        writeText(dir / "palettes" / name, jascPalette(palettes[i]));
    }
}

std::vector<uint8_t> mapBytes(const std::vector<uint16_t>& cells) {
    std::vector<uint8_t> data(cells.size() * 2);
    for (size_t i = 0; i < cells.size(); ++i) {
        writeLE16(data.data() + i * 2, cells[i]);
    }
    return data;
}

uint32_t argb(const Color& color) {
    return makeARGB(color.r, color.g, color.b);
}

} // namespace FRLGRender::test
