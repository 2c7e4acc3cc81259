#pragma once

#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <string>

namespace SkinTone::Domain {

struct SegmentationResult {
    Types::Mask mask;
    int skinPixelCount = 0;

    bool success = false;
    Types::ErrorKind error = Types::ErrorKind::None;
    std::string errorMessage;

    bool hasSkin() const { return success && skinPixelCount > 0; }
};

class ToneAnalysis {
  public:
    ToneAnalysis() = default;

    ToneAnalysis(Types::ToneBand tone, const Types::RGBColor& rgb, const Types::HSVColor& hsv,
                 int skinPixels, int totalPixels)
        : success_(true), tone_(tone), averageRGB_(rgb), averageHSV_(hsv), skinPixels_(skinPixels) {
        skinCoverage_ = totalPixels > 0 ? static_cast<float>(skinPixels) / totalPixels : 0.0f;
    }

    bool isSuccess() const { return success_; }
    Types::ErrorKind getError() const { return error_; }
    const std::string& getErrorMessage() const { return errorMessage_; }

    Types::ToneBand getTone() const { return tone_; }
    std::string getToneName() const { return Types::toString(tone_); }
    const Types::RGBColor& getAverageRGB() const { return averageRGB_; }
    const Types::HSVColor& getAverageHSV() const { return averageHSV_; }
    int getSkinPixelCount() const { return skinPixels_; }
    float getSkinCoverage() const { return skinCoverage_; }

    static ToneAnalysis createFailure(Types::ErrorKind error, const std::string& reason) {
        ToneAnalysis result;
        result.success_ = false;
        result.error_ = error;
        result.errorMessage_ = reason;

        LOG_WARN("Tone analysis failed (", Types::toString(error), "): ", reason);
        return result;
    }

  private:
    bool success_ = false;
    Types::ErrorKind error_ = Types::ErrorKind::None;
    std::string errorMessage_;

    Types::ToneBand tone_ = Types::ToneBand::Medium;
    Types::RGBColor averageRGB_{0, 0, 0};
    Types::HSVColor averageHSV_{0, 0, 0};
    int skinPixels_ = 0;
    float skinCoverage_ = 0.0f;
};

struct ToneTransformResult {
    Types::Image image;
    Types::ToneBand targetTone = Types::ToneBand::Medium;
    int modifiedPixels = 0;

    bool success = false;
    Types::ErrorKind error = Types::ErrorKind::None;
    std::string errorMessage;

    bool isValid() const { return success && !image.empty(); }
};

}  // namespace SkinTone::Domain
