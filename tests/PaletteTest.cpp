#include <catch2/catch.hpp>

#include "Fixtures.h"
#include "core/AssetError.h"
#include "formats/PAL/Palette.h"

using namespace FRLGRender;
using namespace FRLGRender::test;

namespace {

std::string sixteenLines(const std::string& line) {
    std::string out;
    for (int i = 0; i < 16; ++i) {
        out += line + "\n";
    }
    return out;
}

} // namespace

TEST_CASE("palette parses sixteen colours in order", "[palette]")
{
    std::array<Color, kPaletteSize> colors{};
    for (int i = 0; i < kPaletteSize; ++i) {
        colors[i] = Color{static_cast<uint8_t>(i * 10), static_cast<uint8_t>(255 - i), 7};
    }
    Palette palette = Palette::parse(jascPalette(colors), "test.pal");

    REQUIRE(palette.get(0) == Color{0, 255, 7});
    REQUIRE(palette.get(15) == Color{150, 240, 7});
    REQUIRE(palette.entries() == colors);
    REQUIRE_THROWS(palette.get(16));
}

TEST_CASE("palette tolerates CRLF line endings", "[palette]")
{
    std::string text = "JASC-PAL\r\n0100\r\n16\r\n";
    for (int i = 0; i < 16; ++i) {
        text += "1 2 3\r\n";
    }
    REQUIRE(Palette::parse(text, "crlf.pal").get(9) == Color{1, 2, 3});
}

TEST_CASE("palette header must match JASC-PAL 0100 16", "[palette]")
{
    REQUIRE_THROWS_AS(Palette::parse("JASC-PAL\n0200\n16\n" + sixteenLines("0 0 0"), "v.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse("RIFF\n0100\n16\n" + sixteenLines("0 0 0"), "s.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse("JASC-PAL\n0100\n256\n" + sixteenLines("0 0 0"), "n.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse("JASC-PAL\n0100\n", "short.pal"), FormatError);
}

TEST_CASE("palette colour lines are exactly three byte values", "[palette]")
{
    std::string header = "JASC-PAL\n0100\n16\n";

    REQUIRE_THROWS_AS(Palette::parse(header + sixteenLines("1 2"), "two.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse(header + sixteenLines("1 2 3 4"), "four.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse(header + sixteenLines("1 2 256"), "big.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse(header + sixteenLines("1 -2 3"), "neg.pal"), FormatError);
    REQUIRE_THROWS_AS(Palette::parse(header + sixteenLines("1 x 3"), "alpha.pal"), FormatError);

    std::string fifteen = header;
    for (int i = 0; i < 15; ++i) {
        fifteen += "1 2 3\n";
    }
    REQUIRE_THROWS_AS(Palette::parse(fifteen, "fifteen.pal"), FormatError);
}

TEST_CASE("palette store orders by numeric file stem", "[palette]")
{
    TempDir dir;
    writeText(dir.path() / "10.pal", jascPalette(solidColors({10, 10, 10})));
    writeText(dir.path() / "02.pal", jascPalette(solidColors({2, 2, 2})));
    writeText(dir.path() / "1.pal", jascPalette(solidColors({1, 1, 1})));
    writeText(dir.path() / "0.pal", jascPalette(solidColors({0, 0, 1})));
    writeText(dir.path() / "notes.txt", "not a palette");

    auto palettes = PaletteStore::loadDirectory(dir.path().string());

    REQUIRE(palettes.size() == 4);
    REQUIRE(palettes[0].get(1) == Color{0, 0, 1});
    REQUIRE(palettes[1].get(1) == Color{1, 1, 1});
    REQUIRE(palettes[2].get(1) == Color{2, 2, 2});
    REQUIRE(palettes[3].get(1) == Color{10, 10, 10});
}

TEST_CASE("palette store rejects bad directories and names", "[palette]")
{
    TempDir dir;
    REQUIRE_THROWS_AS(PaletteStore::loadDirectory((dir.path() / "missing").string()), IoError);

    writeText(dir.path() / "00.pal", jascPalette(solidColors({1, 2, 3})));
    writeText(dir.path() / "grass.pal", jascPalette(solidColors({1, 2, 3})));
    REQUIRE_THROWS_AS(PaletteStore::loadDirectory(dir.path().string()), FormatError);
}

TEST_CASE("palette store propagates malformed palettes", "[palette]")
{
    TempDir dir;
    writeText(dir.path() / "00.pal", "JASC-PAL\n0100\n16\n");
    REQUIRE_THROWS_AS(PaletteStore::loadDirectory(dir.path().string()), FormatError);
}

TEST_CASE("palette store of an empty directory is empty", "[palette]")
{
    TempDir dir;
    REQUIRE(PaletteStore::loadDirectory(dir.path().string()).empty());
}
