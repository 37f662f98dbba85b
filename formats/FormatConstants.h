#pragma once

#include <cstddef>
#include <cstdint>

namespace FRLGRender {

// Constants of the FireRed/LeafGreen tileset format. None of them can be read
// back from the asset files, so they are fixed here.

constexpr int kTileDimension = 8;       // pixels per tile edge
constexpr int kMetatileDimension = 16;  // pixels per metatile edge
constexpr int kTilesPerMetatile = 8;    // 2x2 bottom layer + 2x2 top layer
constexpr int kTilesPerLayer = 4;
constexpr int kPaletteSize = 16;

// Raw tile ids below this index the primary atlas, the rest the secondary at (id - 640).
constexpr uint16_t kPrimaryTileCount = 640;

constexpr size_t kMetatileRecordSize = kTilesPerMetatile * sizeof(uint16_t);
constexpr size_t kAttributeRecordSize = sizeof(uint32_t);
constexpr size_t kMapCellSize = sizeof(uint16_t);

} // namespace FRLGRender
