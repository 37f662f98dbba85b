#include "BinaryFile.h"

#include <filesystem>
#include <fstream>

#include "AssetError.h"
#include "Logging/Logging.h"

namespace FRLGRender {

std::vector<uint8_t> readBinaryFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IoError("File not found: " + path);
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw IoError("Cannot open file: " + path);
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw IoError("Cannot determine size of file: " + path);
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw IoError("Failed to read file: " + path);
    }

    Log(DEBUG, "BinaryFile", "Read {} bytes from {}", data.size(), path);
    return data;
}

} // namespace FRLGRender
