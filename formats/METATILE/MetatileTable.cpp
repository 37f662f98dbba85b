#include "MetatileTable.h"

#include "core/AssetError.h"
#include "core/BinaryFile.h"
#include "core/Logging/Logging.h"

namespace FRLGRender {

MetatileTable MetatileTable::parse(const std::vector<uint8_t>& metatileData,
                                   const std::vector<uint8_t>& attributeData) {
    if (metatileData.size() % kMetatileRecordSize != 0) {
        throw FormatError("Metatile data length " + std::to_string(metatileData.size()) +
                          " is not a multiple of " + std::to_string(kMetatileRecordSize));
    }
    if (attributeData.size() % kAttributeRecordSize != 0) {
        throw FormatError("Metatile attribute length " + std::to_string(attributeData.size()) +
                          " is not a multiple of " + std::to_string(kAttributeRecordSize));
    }

    size_t count = metatileData.size() / kMetatileRecordSize;
    size_t attributeCount = attributeData.size() / kAttributeRecordSize;
    if (count != attributeCount) {
        throw FormatError("Metatile file has " + std::to_string(count) + " records but attribute file has " +
                          std::to_string(attributeCount));
    }

    std::vector<Metatile> metatiles(count);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* record = metatileData.data() + i * kMetatileRecordSize;
        for (int tile = 0; tile < kTilesPerMetatile; ++tile) {
            metatiles[i].tiles[tile] = TileRef::fromU16(readLE16(record + tile * sizeof(uint16_t)));
        }
        metatiles[i].attributes = MetatileAttributes::fromU32(readLE32(attributeData.data() + i * kAttributeRecordSize));
    }

    return MetatileTable(std::move(metatiles));
}

MetatileTable MetatileTable::loadFiles(const std::string& metatilesPath, const std::string& attributesPath) {
    auto metatileData = readBinaryFile(metatilesPath);
    auto attributeData = readBinaryFile(attributesPath);

    try {
        MetatileTable table = parse(metatileData, attributeData);
        Log(DEBUG, "MetatileTable", "Loaded {} metatiles from {}", table.size(), metatilesPath);
        return table;
    } catch (const FormatError& e) {
        throw FormatError(metatilesPath + ": " + e.what());
    }
}

const Metatile& MetatileTable::at(size_t id) const {
    if (id >= metatiles_.size()) {
        throw RangeError("Metatile " + std::to_string(id) + " out of range (table has " +
                         std::to_string(metatiles_.size()) + ")");
    }
    return metatiles_[id];
}

std::vector<uint8_t> MetatileTable::serializeMetatiles() const {
    std::vector<uint8_t> data(metatiles_.size() * kMetatileRecordSize);
    for (size_t i = 0; i < metatiles_.size(); ++i) {
        uint8_t* record = data.data() + i * kMetatileRecordSize;
        for (int tile = 0; tile < kTilesPerMetatile; ++tile) {
            writeLE16(record + tile * sizeof(uint16_t), metatiles_[i].tiles[tile].toU16());
        }
    }
    return data;
}

std::vector<uint8_t> MetatileTable::serializeAttributes() const {
    std::vector<uint8_t> data(metatiles_.size() * kAttributeRecordSize);
    for (size_t i = 0; i < metatiles_.size(); ++i) {
        writeLE32(data.data() + i * kAttributeRecordSize, metatiles_[i].attributes.toU32());
    }
    return data;
}

} // namespace FRLGRender
