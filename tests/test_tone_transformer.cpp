#include <gtest/gtest.h>

#include "TestImages.hpp"
#include "../modules/skin_tone/internal/correction/ToneTransformer.hpp"
#include <opencv2/imgproc.hpp>

using namespace SkinTone;
using Domain::ToneAdjustment;
using Internal::Correction::ToneTransformer;
using Types::ToneBand;

namespace {

cv::Vec3b toHsv(const cv::Vec3b& bgr) {
    cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(bgr[0], bgr[1], bgr[2]));
    cv::Mat hsv;
    cv::cvtColor(pixel, hsv, cv::COLOR_BGR2HSV);
    return hsv.at<cv::Vec3b>(0, 0);
}

cv::Vec3b toBgr(const cv::Vec3b& hsv) {
    cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(hsv[0], hsv[1], hsv[2]));
    cv::Mat bgr;
    cv::cvtColor(pixel, bgr, cv::COLOR_HSV2BGR);
    return bgr.at<cv::Vec3b>(0, 0);
}

}  // namespace

TEST(ToneAdjustmentTest, FactorTable) {
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Fair).valueFactor, 1.3);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Fair).saturationFactor, 0.7);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Light).valueFactor, 1.2);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Light).saturationFactor, 0.8);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Medium).valueFactor, 1.0);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Medium).saturationFactor, 1.0);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Dark).valueFactor, 0.8);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Dark).saturationFactor, 1.2);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Deep).valueFactor, 0.6);
    EXPECT_DOUBLE_EQ(ToneAdjustment::forBand(ToneBand::Deep).saturationFactor, 1.3);
}

TEST(ToneTransformerTest, AdjustPixelScalesSaturationAndValue) {
    const cv::Vec3b hsv(9, 89, 200);

    EXPECT_EQ(ToneTransformer::adjustPixel(hsv, ToneAdjustment::forBand(ToneBand::Fair)), cv::Vec3b(9, 62, 255));
    EXPECT_EQ(ToneTransformer::adjustPixel(hsv, ToneAdjustment::forBand(ToneBand::Light)), cv::Vec3b(9, 71, 240));
    EXPECT_EQ(ToneTransformer::adjustPixel(hsv, ToneAdjustment::forBand(ToneBand::Medium)), hsv);
    EXPECT_EQ(ToneTransformer::adjustPixel(hsv, ToneAdjustment::forBand(ToneBand::Dark)), cv::Vec3b(9, 106, 160));
    EXPECT_EQ(ToneTransformer::adjustPixel(hsv, ToneAdjustment::forBand(ToneBand::Deep)), cv::Vec3b(9, 115, 120));
}

TEST(ToneTransformerTest, AdjustPixelClampsInsteadOfWrapping) {
    EXPECT_EQ(ToneTransformer::adjustPixel(cv::Vec3b(5, 250, 250), ToneAdjustment::forBand(ToneBand::Deep))[1], 255);
    EXPECT_EQ(ToneTransformer::adjustPixel(cv::Vec3b(5, 250, 250), ToneAdjustment::forBand(ToneBand::Fair))[2], 255);
}

TEST(ToneTransformerTest, MediumLeavesImageUnchanged) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeSplitImage(9, 14, Testing::SKIN_RGB, Testing::BLUE_RGB);

    Domain::ToneTransformResult result = transformer.applyTone(image, ToneBand::Medium);

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.modifiedPixels, 0);
    EXPECT_TRUE(Testing::imagesEqual(result.image, image));
}

TEST(ToneTransformerTest, PixelsOutsideMaskAreUntouched) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeSplitImage(6, 10, Testing::SKIN_RGB, Testing::BLUE_RGB);

    for (ToneBand band : Types::ALL_TONE_BANDS) {
        Domain::ToneTransformResult result = transformer.applyTone(image, band);
        ASSERT_TRUE(result.isValid()) << Types::toString(band);

        cv::Rect nonSkin(5, 0, 5, 6);
        EXPECT_TRUE(Testing::imagesEqual(result.image(nonSkin), image(nonSkin))) << Types::toString(band);
    }
}

TEST(ToneTransformerTest, MaskedPixelsFollowAdjustmentFormula) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeSplitImage(4, 8, Testing::SKIN_RGB, Testing::BLUE_RGB);
    const cv::Vec3b skinBgr = image.at<cv::Vec3b>(0, 0);

    for (ToneBand band : {ToneBand::Fair, ToneBand::Light, ToneBand::Dark, ToneBand::Deep}) {
        Domain::ToneTransformResult result = transformer.applyTone(image, band);
        ASSERT_TRUE(result.isValid());

        cv::Vec3b expectedHsv = ToneTransformer::adjustPixel(toHsv(skinBgr), ToneAdjustment::forBand(band));
        cv::Vec3b expectedBgr = toBgr(expectedHsv);

        EXPECT_EQ(result.modifiedPixels, 16) << Types::toString(band);
        EXPECT_EQ(result.image.at<cv::Vec3b>(0, 0), expectedBgr) << Types::toString(band);
        EXPECT_EQ(result.image.at<cv::Vec3b>(3, 3), expectedBgr) << Types::toString(band);
    }
}

TEST(ToneTransformerTest, DarkerTonesReduceBrightness) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeUniformImage(3, 3, Testing::SKIN_RGB);

    Domain::ToneTransformResult deep = transformer.applyTone(image, ToneBand::Deep);
    Domain::ToneTransformResult fair = transformer.applyTone(image, ToneBand::Fair);
    ASSERT_TRUE(deep.isValid());
    ASSERT_TRUE(fair.isValid());

    EXPECT_EQ(toHsv(deep.image.at<cv::Vec3b>(1, 1))[2], 120);
    EXPECT_EQ(toHsv(fair.image.at<cv::Vec3b>(1, 1))[2], 255);
}

TEST(ToneTransformerTest, InputIsNotMutated) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeUniformImage(5, 5, Testing::SKIN_RGB);
    Types::Image original = image.clone();

    Domain::ToneTransformResult result = transformer.applyTone(image, ToneBand::Deep);

    ASSERT_TRUE(result.isValid());
    EXPECT_TRUE(Testing::imagesEqual(image, original));
    EXPECT_NE(result.image.data, image.data);
    EXPECT_EQ(result.image.size(), image.size());
    EXPECT_EQ(result.image.type(), image.type());
}

TEST(ToneTransformerTest, ImageWithoutSkinIsCopied) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeUniformImage(4, 4, Types::RGBColor(0, 0, 0));

    Domain::ToneTransformResult result = transformer.applyTone(image, ToneBand::Fair);

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.modifiedPixels, 0);
    EXPECT_TRUE(Testing::imagesEqual(result.image, image));
}

TEST(ToneTransformerTest, TextTargetIsParsed) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeUniformImage(2, 2, Testing::SKIN_RGB);

    Domain::ToneTransformResult result = transformer.applyTone(image, std::string("Light"));

    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.targetTone, ToneBand::Light);
}

TEST(ToneTransformerTest, UnknownTargetToneIsRejected) {
    ToneTransformer transformer;
    Types::Image image = Testing::makeUniformImage(2, 2, Testing::SKIN_RGB);

    for (const std::string target : {"Purple", "medium", "", "FAIR"}) {
        Domain::ToneTransformResult result = transformer.applyTone(image, target);
        EXPECT_FALSE(result.success) << target;
        EXPECT_EQ(result.error, Types::ErrorKind::InvalidTargetTone) << target;
        EXPECT_TRUE(result.image.empty()) << target;
    }
}

TEST(ToneTransformerTest, EmptyImageIsInvalid) {
    ToneTransformer transformer;

    Domain::ToneTransformResult result = transformer.applyTone(Types::Image(), ToneBand::Fair);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}
