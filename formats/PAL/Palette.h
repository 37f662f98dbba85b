#ifndef PALETTE_H
#define PALETTE_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "formats/FormatConstants.h"

namespace FRLGRender {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color& other) const = default;
};

/**
 * @class Palette
 * One JASC-PAL palette of 16 colours. Entry 0 doubles as the transparent
 * colour when the palette is used by the top metatile layer.
 */
class Palette {
public:
    Palette() = default;
    explicit Palette(const std::array<Color, kPaletteSize>& entries) : entries_(entries) {}

    const Color& get(size_t entry) const { return entries_.at(entry); }
    const std::array<Color, kPaletteSize>& entries() const { return entries_; }

    // Parses JASC-PAL text. Throws FormatError naming `source` on any deviation.
    static Palette parse(const std::string& contents, const std::string& source);
    static Palette loadFile(const std::string& path);

private:
    std::array<Color, kPaletteSize> entries_{};
};

namespace PaletteStore {

// Every *.pal file in `directory`, ordered by the numeric value of the file
// stem, so that element N answers palette number N of a TileRef. Other files
// are skipped. Throws IoError for a missing directory and FormatError for a
// malformed palette or a non-numeric stem.
std::vector<Palette> loadDirectory(const std::string& directory);

} // namespace PaletteStore

} // namespace FRLGRender

#endif // PALETTE_H
