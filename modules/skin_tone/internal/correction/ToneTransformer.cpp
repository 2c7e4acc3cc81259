#include "ToneTransformer.hpp"
#include "../segmentation/HSVSkinSegmenter.hpp"
#include <chrono>

namespace SkinTone::Internal::Correction {

ToneTransformer::ToneTransformer(std::shared_ptr<const Segmentation::ISegmenter> segmenter)
    : segmenter_(segmenter ? std::move(segmenter)
                           : std::make_shared<Segmentation::HSVSkinSegmenter>()) {
    LOG_DEBUG("Tone transformer initialized");
}

Domain::ToneTransformResult ToneTransformer::applyTone(const Types::Image& input,
                                                       const std::string& targetTone) const {
    std::optional<Types::ToneBand> band = Types::parseToneBand(targetTone);
    if (!band) {
        Domain::ToneTransformResult result;
        result.error = Types::ErrorKind::InvalidTargetTone;
        result.errorMessage = "Invalid target tone: " + targetTone;
        LOG_ERROR(result.errorMessage);
        return result;
    }

    return applyTone(input, *band);
}

Domain::ToneTransformResult ToneTransformer::applyTone(const Types::Image& input,
                                                       Types::ToneBand targetTone) const {
    Domain::ToneTransformResult result;
    result.targetTone = targetTone;

    Domain::SegmentationResult segmentation = segmenter_->segment(input);
    if (!segmentation.success) {
        result.error = segmentation.error;
        result.errorMessage = segmentation.errorMessage;
        return result;
    }

    auto startTime = std::chrono::steady_clock::now();

    try {
        const Domain::ToneAdjustment adjustment = Domain::ToneAdjustment::forBand(targetTone);

        Types::Image hsvImage = colorConverter_.bgrToHsv(input);
        Types::Mask changed = Types::Mask::zeros(input.size(), CV_8UC1);

        for (int y = 0; y < hsvImage.rows; ++y) {
            cv::Vec3b* pixels = hsvImage.ptr<cv::Vec3b>(y);
            const uchar* maskRow = segmentation.mask.ptr<uchar>(y);
            uchar* changedRow = changed.ptr<uchar>(y);

            for (int x = 0; x < hsvImage.cols; ++x) {
                if (maskRow[x] == 0) continue;

                cv::Vec3b adjusted = adjustPixel(pixels[x], adjustment);
                // Unchanged HSV keeps the original bytes; the HSV round trip is lossy
                if (adjusted == pixels[x]) continue;

                pixels[x] = adjusted;
                changedRow[x] = 255;
                ++result.modifiedPixels;
            }
        }

        result.image = input.clone();
        if (result.modifiedPixels > 0) {
            colorConverter_.hsvToBgr(hsvImage).copyTo(result.image, changed);
        }
        result.success = true;

        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);
        LOG_INFO("Applied ", Types::toString(targetTone), " tone to ", result.modifiedPixels, " of ",
                 segmentation.skinPixelCount, " skin pixels in ", duration.count() / 1000.0f, "ms");

    } catch (const cv::Exception& e) {
        result = Domain::ToneTransformResult{};
        result.targetTone = targetTone;
        result.error = Types::ErrorKind::InvalidImage;
        result.errorMessage = "OpenCV exception: " + std::string(e.what());
        LOG_ERROR(result.errorMessage);
    }

    return result;
}

cv::Vec3b ToneTransformer::adjustPixel(const cv::Vec3b& hsv, const Domain::ToneAdjustment& adjustment) {
    return cv::Vec3b(hsv[0],
                     static_cast<uchar>(Types::clampChannel(hsv[1] * adjustment.saturationFactor)),
                     static_cast<uchar>(Types::clampChannel(hsv[2] * adjustment.valueFactor)));
}

}  // namespace SkinTone::Internal::Correction
