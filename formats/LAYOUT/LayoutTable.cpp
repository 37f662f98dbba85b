#include "LayoutTable.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "core/AssetError.h"
#include "core/CFG.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace FRLGRender {

namespace {

const std::string kTilesetSymbolPrefix = "gTileset_";

// Upper bound on layout width and height, in metatiles.
constexpr uint64_t kMaxLayoutDimension = 0xFFFF;

std::string stripTilesetPrefix(const std::string& symbol, const std::string& layoutId) {
    if (symbol.rfind(kTilesetSymbolPrefix, 0) != 0 || symbol.size() == kTilesetSymbolPrefix.size()) {
        throw FormatError("Layout " + layoutId + ": tileset symbol '" + symbol +
                          "' does not start with " + kTilesetSymbolPrefix);
    }
    return symbol.substr(kTilesetSymbolPrefix.size());
}

std::string toLower(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

uint32_t dimensionFromJson(const nlohmann::json& j, const char* key, const std::string& layoutId) {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        throw FormatError("Layout " + layoutId + ": " + key + " is not an unsigned integer: " + value.dump());
    }
    uint64_t dimension = value.get<uint64_t>();
    if (dimension > kMaxLayoutDimension) {
        throw FormatError("Layout " + layoutId + ": " + key + " " + std::to_string(dimension) +
                          " exceeds " + std::to_string(kMaxLayoutDimension));
    }
    return static_cast<uint32_t>(dimension);
}

LayoutEntry entryFromJson(const nlohmann::json& j) {
    LayoutEntry entry;
    entry.id = j.at("id").get<std::string>();
    entry.width = dimensionFromJson(j, "width", entry.id);
    entry.height = dimensionFromJson(j, "height", entry.id);
    entry.primaryTileset = j.at("primary_tileset").get<std::string>();
    entry.secondaryTileset = j.at("secondary_tileset").get<std::string>();
    entry.borderFilepath = j.at("border_filepath").get<std::string>();
    entry.blockdataFilepath = j.at("blockdata_filepath").get<std::string>();
    return entry;
}

} // namespace

LayoutTable LayoutTable::load(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        throw IoError("Cannot open layouts file: " + jsonPath);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), jsonPath);
}

LayoutTable LayoutTable::parse(const std::string& contents, const std::string& source) {
    std::vector<LayoutEntry> entries;
    try {
        nlohmann::json j = nlohmann::json::parse(contents);
        const auto& layouts = j.at("layouts");
        if (!layouts.is_array()) {
            throw FormatError(source + ": \"layouts\" is not an array");
        }
        for (const auto& jl : layouts) {
            // layouts.json keeps placeholder entries ({}) for unused slots
            if (jl.is_object() && jl.empty()) {
                continue;
            }
            entries.push_back(entryFromJson(jl));
        }
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(source + ": " + e.what());
    }

    Log(DEBUG, "LayoutTable", "Loaded {} layouts from {}", entries.size(), source);
    return LayoutTable(std::move(entries));
}

std::optional<LayoutEntry> LayoutTable::find(const std::string& id) const {
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

std::string LayoutTable::toSnakeCase(const std::string& name) {
    std::string out;
    const size_t n = name.size();
    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (i > 0) {
            unsigned char prev = static_cast<unsigned char>(name[i - 1]);
            bool next_lower = i + 1 < n && std::islower(static_cast<unsigned char>(name[i + 1]));
            bool boundary =
                (std::islower(prev) && std::isupper(c)) ||
                (std::isalpha(prev) && std::isdigit(c)) ||
                (std::isdigit(prev) && std::isalpha(c)) ||
                (std::isupper(prev) && std::isupper(c) && next_lower); // SSAnne -> SS|Anne
            if (boundary && out.back() != '_') {
                out += '_';
            }
        }
        if (c == '_' || c == '-' || c == ' ') {
            if (!out.empty() && out.back() != '_') {
                out += '_';
            }
            continue;
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

LayoutDescriptor LayoutTable::resolve(const LayoutEntry& entry, const std::string& rootPath) {
    fs::path root(rootPath);
    LayoutDescriptor descriptor;
    descriptor.id = entry.id;
    descriptor.width = entry.width;
    descriptor.height = entry.height;
    descriptor.primaryTilesetPath =
        (root / "data/tilesets/primary" / toLower(stripTilesetPrefix(entry.primaryTileset, entry.id))).string();
    descriptor.secondaryTilesetPath =
        (root / "data/tilesets/secondary" / toSnakeCase(stripTilesetPrefix(entry.secondaryTileset, entry.id))).string();
    descriptor.mapFilePath = (root / entry.blockdataFilepath).string();
    descriptor.borderFilePath = (root / entry.borderFilepath).string();
    return descriptor;
}

void LayoutTable::registerCommands(CommandTable& commandTable) {
    auto& command = commandTable["layout"];
    command.help = "Layouts of the decompilation (data/layouts/layouts.json)";

    command.actions["list"] = {
        "List every layout id (e.g., layout list)",
        [](const std::vector<std::string>& args) -> int {
            (void)args;
            return runCommand("LayoutTable", []() {
                LayoutTable table = LayoutTable::load(FRLG_CFG.getLayoutsFilePath());
                for (const auto& entry : table.entries()) {
                    std::cout << entry.id << " (" << entry.width << "x" << entry.height << ")" << std::endl;
                }
                return 0;
            });
        }
    };

    command.actions["info"] = {
        "Print the resolved paths of one layout (e.g., layout info LAYOUT_POWER_PLANT)",
        [](const std::vector<std::string>& args) -> int {
            if (args.empty()) {
                std::cerr << "Usage: layout info <LAYOUT_ID>" << std::endl;
                return 1;
            }
            return runCommand("LayoutTable", [&]() {
                LayoutTable table = LayoutTable::load(FRLG_CFG.getLayoutsFilePath());
                auto entry = table.find(args[0]);
                if (!entry) {
                    Log(ERROR, "LayoutTable", "No layout matching name {} found", args[0]);
                    return 1;
                }
                LayoutDescriptor d = LayoutTable::resolve(*entry, FRLG_CFG.getRootPath());
                std::cout << "id:        " << d.id << "\n"
                          << "size:      " << d.width << "x" << d.height << " metatiles\n"
                          << "primary:   " << d.primaryTilesetPath << "\n"
                          << "secondary: " << d.secondaryTilesetPath << "\n"
                          << "map:       " << d.mapFilePath << "\n"
                          << "border:    " << d.borderFilePath << std::endl;
                return 0;
            });
        }
    };
}

} // namespace FRLGRender
