#pragma once

#include "ColorSpaceConverter.hpp"
#include "../domain/ToneAnalysis.hpp"
#include "../segmentation/ISegmenter.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>

namespace SkinTone::Internal::Processing {

class ToneAnalyzer {
  public:
    // Lower V bound of each band, checked from darkest to lightest
    static constexpr int DARK_VALUE_MIN = 100;
    static constexpr int MEDIUM_VALUE_MIN = 140;
    static constexpr int LIGHT_VALUE_MIN = 170;
    static constexpr int FAIR_VALUE_MIN = 200;

    static constexpr const char* NO_SKIN_MESSAGE = "No skin detected in the image";

    struct MaskedColorStatistics {
        Types::RGBColor mean{0, 0, 0};
        int samples = 0;

        bool isValid() const { return samples > 0; }
    };

    // Uses HSVSkinSegmenter when no segmenter is given
    explicit ToneAnalyzer(std::shared_ptr<const Segmentation::ISegmenter> segmenter = nullptr);

    Domain::ToneAnalysis analyze(const Types::Image& image) const;

    // Mean RGB over the pixels selected by mask, truncated to integers
    MaskedColorStatistics computeMaskedMean(const Types::Image& image, const Types::Mask& mask) const;

    static Types::ToneBand classifyValue(int value);

  private:
    std::shared_ptr<const Segmentation::ISegmenter> segmenter_;
    ColorSpaceConverter colorConverter_;
};

}  // namespace SkinTone::Internal::Processing
