#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Raster.h"

namespace FRLGRender {

// Indexed PNG kept at 4 bits per pixel: two pixels per byte, high nibble first.
struct PackedIndexedImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> packed;
};

namespace PNGCodec {

// Throws IoError if the file cannot be opened, FormatError if it is not a
// palette PNG of bit depth 4 or libpng rejects it.
PackedIndexedImage readIndexed4(const std::string& filename);

// Writes an 8-bit RGBA PNG. Throws FormatError for empty or inconsistent
// rasters and IoError when the file cannot be written.
void save(const std::string& filename, const Raster& raster);

} // namespace PNGCodec

} // namespace FRLGRender
