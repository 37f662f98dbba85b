#include <catch2/catch.hpp>

#include "Fixtures.h"
#include "core/AssetError.h"
#include "render/LayoutTileset.h"

using namespace FRLGRender;
using namespace FRLGRender::test;

namespace {

const Color kRed{255, 0, 0};
const Color kOrange{255, 128, 0};
const Color kBlue{0, 0, 255};
const Color kCyan{0, 255, 255};
const Color kMagenta{255, 0, 255};
const Color kYellow{255, 255, 0};

Palette paletteOf(Color one, Color two, Color three) {
    std::array<Color, kPaletteSize> colors{};
    colors[1] = one;
    colors[2] = two;
    colors[3] = three;
    return Palette(colors);
}

const TileRef kClear = ref(1023);

// Primary: 2 metatiles, tiles 0 (index 1) and 1 (index 2).
// Secondary: 1 metatile, tile 0 (index 3).
LayoutTileset testLayoutTileset() {
    AtlasPixels primaryPixels(2, 1);
    primaryPixels.fillTile(0, 1);
    primaryPixels.fillTile(1, 2);
    AtlasPixels secondaryPixels(1, 1);
    secondaryPixels.fillTile(0, 3);

    Tileset primary(MetatileTable({makeMetatile({ref(0), ref(640), ref(1), ref(0), kClear, kClear, kClear, kClear}),
                                   makeMetatile({ref(1), ref(1), ref(1), ref(1), kClear, kClear, kClear, kClear})}),
                    TileAtlas(primaryPixels.packed(), 2, 1), {paletteOf(kRed, kOrange, kBlue)});
    Tileset secondary(MetatileTable({makeMetatile({ref(640), ref(1), ref(645), ref(2),
                                                   kClear, kClear, kClear, kClear})}),
                      TileAtlas(secondaryPixels.packed(), 1, 1), {paletteOf(kCyan, kMagenta, kYellow)});
    return LayoutTileset(std::move(primary), std::move(secondary));
}

} // namespace

TEST_CASE("global metatile ids route by the primary metatile count", "[layout-tileset]")
{
    LayoutTileset tileset = testLayoutTileset();

    REQUIRE(tileset.primaryCount() == 2);
    REQUIRE(tileset.metatileCount() == 3);

    auto first = tileset.renderMetatile(0);
    REQUIRE(first.has_value());
    REQUIRE(first->at(0, 0) == argb(kRed));

    auto second = tileset.renderMetatile(1);
    REQUIRE(second.has_value());
    REQUIRE(second->at(15, 15) == argb(kOrange));

    auto third = tileset.renderMetatile(2);
    REQUIRE(third.has_value());
    REQUIRE(third->at(0, 0) == argb(kYellow));
}

TEST_CASE("metatile ids at or past the total are absent", "[layout-tileset]")
{
    LayoutTileset tileset = testLayoutTileset();

    REQUIRE_FALSE(tileset.renderMetatile(3).has_value());
    REQUIRE_FALSE(tileset.renderMetatile(1023).has_value());
}

TEST_CASE("tile ids split at 640 regardless of the metatile split", "[layout-tileset]")
{
    LayoutTileset tileset = testLayoutTileset();

    // primary metatile pointing into the secondary atlas, drawn with the primary palette
    auto primaryBlock = tileset.renderMetatile(0);
    REQUIRE(primaryBlock->at(8, 0) == argb(kBlue));
    REQUIRE(primaryBlock->at(0, 8) == argb(kOrange));

    // secondary metatile pointing into the primary atlas, drawn with the secondary palette
    auto secondaryBlock = tileset.renderMetatile(2);
    REQUIRE(secondaryBlock->at(8, 0) == argb(kMagenta));
    // 645 -> secondary tile 5 and 2 -> primary tile 2 do not exist
    REQUIRE(secondaryBlock->at(0, 8) == kOpaqueBlack);
    REQUIRE(secondaryBlock->at(8, 8) == kOpaqueBlack);
}

TEST_CASE("layout tileset loads both directories", "[layout-tileset]")
{
    TempDir dir;
    AtlasPixels pixels(1, 1);
    pixels.fillTile(0, 1);
    writeTileset(dir.path() / "primary", {makeMetatile({ref(0), ref(0), ref(0), ref(0), kClear, kClear, kClear, kClear})},
                 pixels, {solidColors(kRed)});
    writeTileset(dir.path() / "secondary",
                 {makeMetatile({ref(640), ref(640), ref(640), ref(640), kClear, kClear, kClear, kClear})},
                 pixels, {solidColors(kCyan)});

    LayoutTileset tileset = LayoutTileset::load(dir.file("primary"), dir.file("secondary"));

    REQUIRE(tileset.metatileCount() == 2);
    REQUIRE(tileset.renderMetatile(0)->at(4, 4) == argb(kRed));
    REQUIRE(tileset.renderMetatile(1)->at(4, 4) == argb(kCyan));
    REQUIRE_THROWS_AS(LayoutTileset::load(dir.file("primary"), dir.file("nowhere")), IoError);
}
