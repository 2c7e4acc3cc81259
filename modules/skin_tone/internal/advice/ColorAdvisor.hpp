#pragma once

#include "../domain/Recommendation.hpp"
#include <shared/types/Common.hpp>
#include <map>
#include <string>
#include <vector>

namespace SkinTone::Internal::Advice {

class ColorAdvisor {
  public:
    static constexpr int DEFAULT_COMPLEMENTARY_COUNT = 4;
    static constexpr int MAX_COMPLEMENTARY_COUNT = 360;

    ColorAdvisor() = default;

    Domain::Recommendation recommend(Types::ToneBand band) const;

    // Unknown names fall back to Medium with a warning
    Domain::Recommendation recommend(const std::string& toneName) const;

    // Colours with hues spaced evenly around the wheel from baseColor, keeping its
    // saturation and value. Returned as lowercase "#rrggbb". count is capped at
    // MAX_COMPLEMENTARY_COUNT.
    std::vector<Types::ColorCode> generateComplementaryColors(
        const Types::RGBColor& baseColor, int count = DEFAULT_COMPLEMENTARY_COUNT) const;

  private:
    static const std::map<Types::ToneBand, Domain::Recommendation>& recommendationTable();
};

}  // namespace SkinTone::Internal::Advice
