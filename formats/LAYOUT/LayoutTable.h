#ifndef LAYOUT_TABLE_H
#define LAYOUT_TABLE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/CommandRegistry.h"

namespace FRLGRender {

// One element of the "layouts" array in data/layouts/layouts.json.
struct LayoutEntry {
    std::string id;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string primaryTileset;   // symbol, e.g. gTileset_General
    std::string secondaryTileset; // symbol, e.g. gTileset_CeladonCity
    std::string borderFilepath;
    std::string blockdataFilepath;
};

// Everything needed to render one layout, with filesystem paths resolved.
struct LayoutDescriptor {
    std::string id;
    uint32_t width = 0;
    uint32_t height = 0;
    std::string primaryTilesetPath;
    std::string secondaryTilesetPath;
    std::string mapFilePath;
    std::string borderFilePath;
};

class LayoutTable {
public:
    LayoutTable() = default;
    explicit LayoutTable(std::vector<LayoutEntry> entries) : entries_(std::move(entries)) {}

    // Throws IoError when the file is missing, FormatError for malformed JSON
    // or a missing / mistyped field. Unknown keys are ignored.
    static LayoutTable load(const std::string& jsonPath);
    static LayoutTable parse(const std::string& contents, const std::string& source);

    std::optional<LayoutEntry> find(const std::string& id) const;
    const std::vector<LayoutEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // Maps tileset symbols to tileset directories under rootPath. Throws
    // FormatError when a symbol lacks the gTileset_ prefix.
    static LayoutDescriptor resolve(const LayoutEntry& entry, const std::string& rootPath);
    // CeladonCity -> celadon_city, SSAnne -> ss_anne, SeviiIslands45 -> sevii_islands_45
    static std::string toSnakeCase(const std::string& name);

    static void registerCommands(CommandTable& commandTable);

private:
    std::vector<LayoutEntry> entries_;
};

} // namespace FRLGRender

#endif // LAYOUT_TABLE_H
