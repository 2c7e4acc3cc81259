#pragma once

#include <shared/types/Common.hpp>
#include <string>
#include <vector>

namespace SkinTone::Domain {

struct PaletteEntry {
    std::string name;
    std::vector<Types::ColorCode> colors;

    bool operator==(const PaletteEntry& other) const {
        return name == other.name && colors == other.colors;
    }
};

struct Recommendation {
    Types::ToneBand band = Types::ToneBand::Medium;
    std::vector<PaletteEntry> palettes;
    std::vector<Types::ColorCode> avoid;
};

}  // namespace SkinTone::Domain
