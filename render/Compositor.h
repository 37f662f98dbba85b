#ifndef COMPOSITOR_H
#define COMPOSITOR_H

#include "LayoutTileset.h"
#include "core/CommandRegistry.h"
#include "formats/LAYOUT/LayoutTable.h"
#include "formats/MAP/MapGrid.h"
#include "formats/PNG/Raster.h"

namespace FRLGRender {

namespace Compositor {

// width*16 x height*16 raster of the grid. Cells whose metatile id does not
// resolve are logged and stay black; border cells are not drawn.
Raster render(const MapGrid& grid, const LayoutTileset& tileset);

// Loads the tilesets and map files of `descriptor` and renders them. Load
// failures propagate as AssetError.
Raster renderLayout(const LayoutDescriptor& descriptor);

void registerCommands(CommandTable& commandTable);

} // namespace Compositor

} // namespace FRLGRender

#endif // COMPOSITOR_H
