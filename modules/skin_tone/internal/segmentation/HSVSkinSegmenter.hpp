#pragma once

#include "ISegmenter.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>

namespace SkinTone::Internal::Segmentation {

// Marks a pixel as skin when its HSV value lies inside a fixed box
class HSVSkinSegmenter : public ISegmenter {
  public:
    // Inclusive bounds on the OpenCV 8-bit HSV scale
    static constexpr int HUE_MIN = 0;
    static constexpr int HUE_MAX = 20;
    static constexpr int SATURATION_MIN = 20;
    static constexpr int SATURATION_MAX = 255;
    static constexpr int VALUE_MIN = 70;
    static constexpr int VALUE_MAX = 255;

    HSVSkinSegmenter() = default;

    Domain::SegmentationResult segment(const Types::Image& image) const override;

    std::string getName() const override { return "HSV threshold"; }

    static cv::Scalar lowerBound() { return cv::Scalar(HUE_MIN, SATURATION_MIN, VALUE_MIN); }
    static cv::Scalar upperBound() { return cv::Scalar(HUE_MAX, SATURATION_MAX, VALUE_MAX); }

  private:
    Processing::ColorSpaceConverter colorConverter_;
};

}  // namespace SkinTone::Internal::Segmentation
