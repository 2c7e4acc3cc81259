#include "ColorAdvisor.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include <shared/utils/Logger.hpp>
#include <cmath>

namespace SkinTone::Internal::Advice {

using Types::ToneBand;

const std::map<ToneBand, Domain::Recommendation>& ColorAdvisor::recommendationTable() {
    static const std::map<ToneBand, Domain::Recommendation> table = {
        {ToneBand::Fair,
         {ToneBand::Fair,
          {{"Soft pastels", {"#E6B3B3", "#B3E6CC", "#B3CCE6", "#E6CCB3"}},
           {"Cool blues", {"#6699CC", "#336699", "#003366", "#99CCFF"}},
           {"Soft pinks", {"#FFB6C1", "#FF69B4", "#FFC0CB", "#DB7093"}},
           {"Emerald greens", {"#2E8B57", "#3CB371", "#00FF7F", "#66CDAA"}}},
          // Bright oranges
          {"#FFA500", "#FF8C00", "#FF7F50", "#FF4500"}}},
        {ToneBand::Light,
         {ToneBand::Light,
          {{"Jewel tones", {"#9932CC", "#8A2BE2", "#4B0082", "#800080"}},
           {"Soft neutrals", {"#D2B48C", "#DEB887", "#F5DEB3", "#FFDEAD"}},
           {"Dusty pinks", {"#DBB2D1", "#C9A9C9", "#DDA0DD", "#D8BFD8"}},
           {"Olive greens", {"#808000", "#6B8E23", "#556B2F", "#BDB76B"}}},
          // Pale yellows
          {"#FFFF00", "#FFFFE0", "#FFFACD", "#FAFAD2"}}},
        {ToneBand::Medium,
         {ToneBand::Medium,
          {{"Earth tones", {"#CD853F", "#D2691E", "#8B4513", "#A0522D"}},
           {"Coral shades", {"#FF7F50", "#FF6347", "#FA8072", "#E9967A"}},
           {"Teals", {"#008080", "#20B2AA", "#5F9EA0", "#00CED1"}},
           {"Rich purples", {"#800080", "#8B008B", "#9400D3", "#9932CC"}}},
          // Light yellows
          {"#F0E68C", "#EEE8AA", "#FAFAD2", "#FFFFE0"}}},
        {ToneBand::Dark,
         {ToneBand::Dark,
          {{"Bright colors", {"#FF0000", "#00FF00", "#0000FF", "#FFFF00"}},
           {"Orange shades", {"#FFA500", "#FF8C00", "#FF7F50", "#FF4500"}},
           {"Warm reds", {"#FF0000", "#DC143C", "#B22222", "#8B0000"}},
           {"Gold tones", {"#FFD700", "#DAA520", "#B8860B", "#CD853F"}}},
          // Very dark colors
          {"#000080", "#00008B", "#191970", "#2F4F4F"}}},
        {ToneBand::Deep,
         {ToneBand::Deep,
          {{"Vibrant colors", {"#FF1493", "#00FFFF", "#FF4500", "#7FFF00"}},
           {"Bright yellows", {"#FFFF00", "#FFD700", "#FFA500", "#FFFF54"}},
           {"Fuchsia pinks", {"#FF00FF", "#FF69B4", "#FF1493", "#C71585"}},
           {"Bright blues", {"#1E90FF", "#00BFFF", "#87CEEB", "#00FFFF"}}},
          // Muted grays
          {"#A9A9A9", "#696969", "#808080", "#778899"}}},
    };
    return table;
}

Domain::Recommendation ColorAdvisor::recommend(ToneBand band) const {
    return recommendationTable().at(band);
}

Domain::Recommendation ColorAdvisor::recommend(const std::string& toneName) const {
    std::optional<ToneBand> band = Types::parseToneBand(toneName);
    if (!band) {
        LOG_WARN("Unknown skin tone: '", toneName, "', defaulting to Medium");
        band = ToneBand::Medium;
    }
    return recommend(*band);
}

std::vector<Types::ColorCode> ColorAdvisor::generateComplementaryColors(
    const Types::RGBColor& baseColor, int count) const {

    std::vector<Types::ColorCode> colors;
    if (count <= 0) return colors;
    if (count > MAX_COMPLEMENTARY_COUNT) {
        LOG_WARN("Requested ", count, " complementary colors, limiting to ", MAX_COMPLEMENTARY_COUNT);
        count = MAX_COMPLEMENTARY_COUNT;
    }

    using Converter = Processing::ColorSpaceConverter;
    Converter::UnitHSV base = Converter::rgbToUnitHsv(baseColor);

    colors.reserve(count);
    for (int i = 0; i < count; ++i) {
        Converter::UnitHSV shifted = base;
        shifted.h = std::fmod(base.h + static_cast<double>(i) / count, 1.0);
        colors.push_back(Converter::toHexCode(Converter::unitHsvToRgb(shifted)));
    }

    LOG_DEBUG("Generated ", colors.size(), " complementary colors");
    return colors;
}

}  // namespace SkinTone::Internal::Advice
