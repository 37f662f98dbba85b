#include "Palette.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/AssetError.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace FRLGRender {

namespace {

const char* kJascSignature = "JASC-PAL";
const char* kJascVersion = "0100";

bool nextLine(std::istringstream& stream, std::string& line) {
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool parseByte(const std::string& token, uint8_t& value) {
    if (token.empty() || token.size() > 3 ||
        !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    int parsed = std::stoi(token);
    if (parsed > 255) {
        return false;
    }
    value = static_cast<uint8_t>(parsed);
    return true;
}

bool parseColorLine(const std::string& line, Color& color) {
    std::istringstream tokens(line);
    std::vector<std::string> values;
    std::string token;
    while (tokens >> token) {
        values.push_back(token);
    }
    if (values.size() != 3) {
        return false;
    }
    return parseByte(values[0], color.r) && parseByte(values[1], color.g) && parseByte(values[2], color.b);
}

bool isPalFile(const fs::path& path) {
    return path.extension() == ".pal";
}

uint32_t paletteNumber(const fs::path& path) {
    std::string stem = path.stem().string();
    if (stem.empty() || stem.size() > 9 ||
        !std::all_of(stem.begin(), stem.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw FormatError("Palette file name is not a number: " + path.string());
    }
    return static_cast<uint32_t>(std::stoul(stem));
}

} // namespace

Palette Palette::parse(const std::string& contents, const std::string& source) {
    std::istringstream stream(contents);
    std::string signature, version, entryCount;

    if (!nextLine(stream, signature) || !nextLine(stream, version) || !nextLine(stream, entryCount)) {
        throw FormatError("Truncated JASC-PAL header in " + source);
    }
    if (signature != kJascSignature || version != kJascVersion) {
        throw FormatError("Bad JASC-PAL header in " + source + ": '" + signature + "' '" + version + "'");
    }
    if (entryCount != std::to_string(kPaletteSize)) {
        throw FormatError("Palette " + source + " declares " + entryCount + " entries, expected " +
                          std::to_string(kPaletteSize));
    }

    std::array<Color, kPaletteSize> entries{};
    for (int entry = 0; entry < kPaletteSize; ++entry) {
        std::string line;
        if (!nextLine(stream, line)) {
            throw FormatError("Palette " + source + " ends after " + std::to_string(entry) + " colours");
        }
        if (!parseColorLine(line, entries[entry])) {
            throw FormatError("Palette " + source + " entry " + std::to_string(entry) +
                              " is not three byte values: '" + line + "'");
        }
        Log(DEBUG, "Palette", "Entry {}: {} {} {}", entry, entries[entry].r, entries[entry].g, entries[entry].b);
    }

    return Palette(entries);
}

Palette Palette::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IoError("Cannot open palette file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Log(DEBUG, "Palette", "Loading palette {}", path);
    return parse(buffer.str(), path);
}

namespace PaletteStore {

std::vector<Palette> loadDirectory(const std::string& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw IoError("Palette directory not found: " + directory);
    }

    std::vector<std::pair<uint32_t, fs::path>> files;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw IoError("Cannot list palette directory " + directory + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file() || !isPalFile(entry.path())) {
            continue;
        }
        files.emplace_back(paletteNumber(entry.path()), entry.path());
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Palette> palettes;
    palettes.reserve(files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        if (i > 0 && files[i].first == files[i - 1].first) {
            throw FormatError("Duplicate palette number " + std::to_string(files[i].first) + " in " + directory);
        }
        if (files[i].first != i) {
            Log(WARNING, "Palette", "Palette file {} is loaded as palette {}", files[i].second.string(), i);
        }
        palettes.push_back(Palette::loadFile(files[i].second.string()));
    }

    Log(DEBUG, "Palette", "Loaded {} palettes from {}", palettes.size(), directory);
    return palettes;
}

} // namespace PaletteStore

} // namespace FRLGRender
