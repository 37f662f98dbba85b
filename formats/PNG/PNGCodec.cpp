#include "PNGCodec.h"

#include <csetjmp>
#include <cstdio>

#include <png.h>

#include "core/AssetError.h"
#include "core/Logging/Logging.h"

namespace FRLGRender {

namespace {

void pngWarning(png_structp, png_const_charp message) {
    Log(WARNING, "PNG", "libpng: {}", message);
}

void pngError(png_structp png, png_const_charp message) {
    Log(ERROR, "PNG", "libpng: {}", message);
    png_longjmp(png, 1);
}

// Closes the FILE on every exit path of the setjmp-guarded readers and writers.
struct FileCloser {
    FILE* file;
    ~FileCloser() {
        if (file) {
            fclose(file);
        }
    }
};

} // namespace

namespace PNGCodec {

PackedIndexedImage readIndexed4(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "rb");
    if (!file) {
        throw IoError("Cannot open PNG file: " + filename);
    }
    FileCloser closer{file};

    uint8_t header[8];
    if (fread(header, 1, sizeof(header), file) != sizeof(header)) {
        throw FormatError("Cannot read PNG header from: " + filename);
    }
    if (png_sig_cmp(header, 0, sizeof(header))) {
        throw FormatError("File is not a PNG file: " + filename);
    }

    png_structp png_ptr = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, pngError, pngWarning);
    if (!png_ptr) {
        throw FormatError("png_create_read_struct failed for: " + filename);
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        throw FormatError("png_create_info_struct failed for: " + filename);
    }

    // Declared ahead of setjmp so a longjmp never skips their destructors.
    PackedIndexedImage image;
    std::vector<png_bytep> row_pointers;
    std::string formatProblem;

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        throw FormatError("libpng failed to decode: " + filename);
    }

    png_init_io(png_ptr, file);
    png_set_sig_bytes(png_ptr, sizeof(header));
    png_read_info(png_ptr, info_ptr);

    png_uint_32 width = png_get_image_width(png_ptr, info_ptr);
    png_uint_32 height = png_get_image_height(png_ptr, info_ptr);
    png_byte color_type = png_get_color_type(png_ptr, info_ptr);
    png_byte bit_depth = png_get_bit_depth(png_ptr, info_ptr);

    if (color_type != PNG_COLOR_TYPE_PALETTE) {
        formatProblem = "is not an indexed-colour image";
    } else if (bit_depth != 4) {
        formatProblem = "has bit depth " + std::to_string(bit_depth) + ", expected 4";
    } else if (width % 8 != 0 || height % 8 != 0) {
        formatProblem = "is " + std::to_string(width) + "x" + std::to_string(height) +
                        ", not a multiple of 8 in both axes";
    }
    if (!formatProblem.empty()) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        throw FormatError("Tile image " + filename + " " + formatProblem);
    }

    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    size_t rowBytes = png_get_rowbytes(png_ptr, info_ptr);
    image.width = static_cast<int>(width);
    image.height = static_cast<int>(height);
    image.packed.resize(rowBytes * height);
    row_pointers.resize(height);
    for (png_uint_32 y = 0; y < height; y++) {
        row_pointers[y] = image.packed.data() + y * rowBytes;
    }

    png_read_image(png_ptr, row_pointers.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);

    Log(DEBUG, "PNG", "Read {}x{} 4bpp indexed image from {} ({} bytes packed)",
        image.width, image.height, filename, image.packed.size());
    return image;
}

void save(const std::string& filename, const Raster& raster) {
    // libpng doesn't handle writing 0x0 files well
    if (raster.width <= 0 || raster.height <= 0) {
        throw FormatError("Invalid image dimensions for saving: " + std::to_string(raster.width) + "x" +
                          std::to_string(raster.height));
    }

    size_t expectedPixels = static_cast<size_t>(raster.width) * static_cast<size_t>(raster.height);
    if (raster.pixels.size() != expectedPixels) {
        throw FormatError("Pixel data size mismatch: expected " + std::to_string(expectedPixels) + ", got " +
                          std::to_string(raster.pixels.size()));
    }

    FILE* file = fopen(filename.c_str(), "wb");
    if (!file) {
        throw IoError("Cannot create file: " + filename);
    }
    FileCloser closer{file};

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, pngError, pngWarning);
    if (!png_ptr) {
        throw IoError("png_create_write_struct failed for: " + filename);
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        throw IoError("png_create_info_struct failed for: " + filename);
    }

    std::vector<uint8_t> row_data(static_cast<size_t>(raster.width) * 4);

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        throw IoError("libpng failed to write: " + filename);
    }

    png_init_io(png_ptr, file);
    png_set_IHDR(png_ptr, info_ptr, raster.width, raster.height, 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);

    // ARGB -> RGBA
    for (int y = 0; y < raster.height; y++) {
        for (int x = 0; x < raster.width; x++) {
            uint32_t pixel = raster.at(x, y);
            row_data[x * 4 + 0] = (pixel >> 16) & 0xFF;
            row_data[x * 4 + 1] = (pixel >> 8) & 0xFF;
            row_data[x * 4 + 2] = pixel & 0xFF;
            row_data[x * 4 + 3] = (pixel >> 24) & 0xFF;
        }
        png_write_row(png_ptr, row_data.data());
    }

    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    Log(DEBUG, "PNG", "Wrote {}x{} image to {}", raster.width, raster.height, filename);
}

} // namespace PNGCodec

} // namespace FRLGRender
