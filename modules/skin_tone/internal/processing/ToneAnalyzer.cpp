#include "ToneAnalyzer.hpp"
#include "../segmentation/HSVSkinSegmenter.hpp"

namespace SkinTone::Internal::Processing {

ToneAnalyzer::ToneAnalyzer(std::shared_ptr<const Segmentation::ISegmenter> segmenter)
    : segmenter_(segmenter ? std::move(segmenter)
                           : std::make_shared<Segmentation::HSVSkinSegmenter>()) {
    LOG_DEBUG("Tone analyzer initialized with ", segmenter_->getName(), " segmenter");
}

Domain::ToneAnalysis ToneAnalyzer::analyze(const Types::Image& image) const {
    Domain::SegmentationResult segmentation = segmenter_->segment(image);
    if (!segmentation.success) {
        return Domain::ToneAnalysis::createFailure(segmentation.error, segmentation.errorMessage);
    }

    try {
        MaskedColorStatistics stats = computeMaskedMean(image, segmentation.mask);
        if (!stats.isValid()) {
            return Domain::ToneAnalysis::createFailure(Types::ErrorKind::NoSkinDetected,
                                                       NO_SKIN_MESSAGE);
        }

        Types::HSVColor averageHSV = colorConverter_.rgbToHsv(stats.mean);
        Types::ToneBand tone = classifyValue(averageHSV[2]);

        LOG_INFO("Detected ", Types::toString(tone), " skin tone from ", stats.samples,
                 " pixels (RGB ", stats.mean[0], ",", stats.mean[1], ",", stats.mean[2],
                 "; HSV ", averageHSV[0], ",", averageHSV[1], ",", averageHSV[2], ")");

        return Domain::ToneAnalysis(tone, stats.mean, averageHSV, stats.samples,
                                    static_cast<int>(image.total()));

    } catch (const cv::Exception& e) {
        return Domain::ToneAnalysis::createFailure(Types::ErrorKind::InvalidImage,
                                                   "OpenCV exception: " + std::string(e.what()));
    }
}

ToneAnalyzer::MaskedColorStatistics ToneAnalyzer::computeMaskedMean(
    const Types::Image& image, const Types::Mask& mask) const {

    MaskedColorStatistics stats;

    if (!ColorSpaceConverter::isColorImage(image) || mask.type() != CV_8UC1 ||
        mask.size() != image.size()) {
        LOG_ERROR("Invalid input for masked mean");
        return stats;
    }

    // Integer sums keep the result independent of visiting order
    std::uint64_t sumR = 0, sumG = 0, sumB = 0;
    std::uint64_t count = 0;

    for (int y = 0; y < image.rows; ++y) {
        const cv::Vec3b* pixels = image.ptr<cv::Vec3b>(y);
        const uchar* maskRow = mask.ptr<uchar>(y);

        for (int x = 0; x < image.cols; ++x) {
            if (maskRow[x] == 0) continue;
            Types::RGBColor rgb = ColorSpaceConverter::bgrToRgb(pixels[x]);
            sumR += rgb[0];
            sumG += rgb[1];
            sumB += rgb[2];
            ++count;
        }
    }

    if (count == 0) return stats;

    stats.samples = static_cast<int>(count);
    stats.mean = Types::RGBColor(static_cast<int>(sumR / count), static_cast<int>(sumG / count),
                                 static_cast<int>(sumB / count));
    return stats;
}

Types::ToneBand ToneAnalyzer::classifyValue(int value) {
    if (value < DARK_VALUE_MIN) return Types::ToneBand::Deep;
    if (value < MEDIUM_VALUE_MIN) return Types::ToneBand::Dark;
    if (value < LIGHT_VALUE_MIN) return Types::ToneBand::Medium;
    if (value < FAIR_VALUE_MIN) return Types::ToneBand::Light;
    return Types::ToneBand::Fair;
}

}  // namespace SkinTone::Internal::Processing
