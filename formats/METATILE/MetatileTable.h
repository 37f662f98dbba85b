#ifndef METATILE_TABLE_H
#define METATILE_TABLE_H

#include <cstdint>
#include <string>
#include <vector>

#include "MetatileV1.hpp"

namespace FRLGRender {

/**
 * @class MetatileTable
 * Metatiles of one tileset, decoded from the parallel metatiles.bin and
 * metatile_attributes.bin arrays.
 */
class MetatileTable {
public:
    MetatileTable() = default;
    explicit MetatileTable(std::vector<Metatile> metatiles) : metatiles_(std::move(metatiles)) {}

    // Throws FormatError on misaligned lengths or differing record counts.
    static MetatileTable parse(const std::vector<uint8_t>& metatileData,
                               const std::vector<uint8_t>& attributeData);
    static MetatileTable loadFiles(const std::string& metatilesPath, const std::string& attributesPath);

    size_t size() const { return metatiles_.size(); }
    bool empty() const { return metatiles_.empty(); }
    // Throws RangeError when id >= size().
    const Metatile& at(size_t id) const;
    const std::vector<Metatile>& metatiles() const { return metatiles_; }

    // Wire form, the inverse of parse().
    std::vector<uint8_t> serializeMetatiles() const;
    std::vector<uint8_t> serializeAttributes() const;

private:
    std::vector<Metatile> metatiles_;
};

} // namespace FRLGRender

#endif // METATILE_TABLE_H
