#include "HSVSkinSegmenter.hpp"

namespace SkinTone::Internal::Segmentation {

Domain::SegmentationResult HSVSkinSegmenter::segment(const Types::Image& image) const {
    Domain::SegmentationResult result;

    if (!Processing::ColorSpaceConverter::isColorImage(image)) {
        result.error = Types::ErrorKind::InvalidImage;
        result.errorMessage = image.empty() ? "Input image is empty"
                                            : "Input image must be 8-bit with 3 channels";
        LOG_ERROR(result.errorMessage);
        return result;
    }

    try {
        Types::Image hsvImage = colorConverter_.bgrToHsv(image);
        cv::inRange(hsvImage, lowerBound(), upperBound(), result.mask);

        result.skinPixelCount = cv::countNonZero(result.mask);
        result.success = true;

        LOG_DEBUG("Segmented ", image.cols, "x", image.rows, " image: ", result.skinPixelCount,
                  " skin pixels");

    } catch (const cv::Exception& e) {
        result = Domain::SegmentationResult{};
        result.error = Types::ErrorKind::InvalidImage;
        result.errorMessage = "OpenCV exception: " + std::string(e.what());
        LOG_ERROR(result.errorMessage);
    }

    return result;
}

}  // namespace SkinTone::Internal::Segmentation
