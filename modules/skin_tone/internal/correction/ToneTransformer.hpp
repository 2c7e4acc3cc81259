#pragma once

#include "../domain/ToneAdjustment.hpp"
#include "../domain/ToneAnalysis.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include "../segmentation/ISegmenter.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <memory>
#include <string>

namespace SkinTone::Internal::Correction {

// Shifts the brightness and saturation of skin pixels towards a target tone band.
// Pixels outside the skin mask are copied from the input unchanged; the input
// image is never written to.
class ToneTransformer {
  public:
    explicit ToneTransformer(std::shared_ptr<const Segmentation::ISegmenter> segmenter = nullptr);

    Domain::ToneTransformResult applyTone(const Types::Image& input, Types::ToneBand targetTone) const;

    // Fails with InvalidTargetTone unless targetTone names one of the five bands
    Domain::ToneTransformResult applyTone(const Types::Image& input, const std::string& targetTone) const;

    // Multiply, clamp to [0,255], truncate. Hue is left alone.
    static cv::Vec3b adjustPixel(const cv::Vec3b& hsv, const Domain::ToneAdjustment& adjustment);

  private:
    std::shared_ptr<const Segmentation::ISegmenter> segmenter_;
    Processing::ColorSpaceConverter colorConverter_;
};

}  // namespace SkinTone::Internal::Correction
