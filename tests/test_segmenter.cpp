#include <gtest/gtest.h>

#include "TestImages.hpp"
#include "../modules/skin_tone/internal/segmentation/HSVSkinSegmenter.hpp"

using namespace SkinTone;
using Internal::Segmentation::HSVSkinSegmenter;

TEST(HSVSkinSegmenterTest, MaskMatchesInputDimensions) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeSplitImage(7, 13, Testing::SKIN_RGB, Testing::BLUE_RGB);

    Domain::SegmentationResult result = segmenter.segment(image);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.mask.rows, 7);
    EXPECT_EQ(result.mask.cols, 13);
    EXPECT_EQ(result.mask.type(), CV_8UC1);
}

TEST(HSVSkinSegmenterTest, MaskIsBooleanValued) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeSplitImage(10, 10, Testing::SKIN_RGB, Testing::BLUE_RGB);

    Domain::SegmentationResult result = segmenter.segment(image);
    ASSERT_TRUE(result.success);

    cv::Mat nonBinary = (result.mask != 0) & (result.mask != 255);
    EXPECT_EQ(cv::countNonZero(nonBinary), 0);
}

TEST(HSVSkinSegmenterTest, BlackImageHasNoSkin) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeUniformImage(8, 8, Types::RGBColor(0, 0, 0));

    Domain::SegmentationResult result = segmenter.segment(image);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::None);
    EXPECT_EQ(result.skinPixelCount, 0);
    EXPECT_FALSE(result.hasSkin());
    EXPECT_EQ(cv::countNonZero(result.mask), 0);
}

TEST(HSVSkinSegmenterTest, UniformSkinImageIsAllSkin) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeUniformImage(6, 9, Testing::SKIN_RGB);

    Domain::SegmentationResult result = segmenter.segment(image);

    ASSERT_TRUE(result.hasSkin());
    EXPECT_EQ(result.skinPixelCount, 54);
    EXPECT_EQ(cv::countNonZero(result.mask), 54);
}

TEST(HSVSkinSegmenterTest, OnlySkinHalfIsMasked) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeSplitImage(4, 10, Testing::SKIN_RGB, Testing::BLUE_RGB);

    Domain::SegmentationResult result = segmenter.segment(image);
    ASSERT_TRUE(result.success);

    EXPECT_EQ(result.skinPixelCount, 20);
    EXPECT_EQ(result.mask.at<uchar>(0, 0), 255);
    EXPECT_EQ(result.mask.at<uchar>(3, 4), 255);
    EXPECT_EQ(result.mask.at<uchar>(0, 5), 0);
    EXPECT_EQ(result.mask.at<uchar>(3, 9), 0);
}

TEST(HSVSkinSegmenterTest, EmptyImageIsInvalid) {
    HSVSkinSegmenter segmenter;

    Domain::SegmentationResult result = segmenter.segment(Types::Image());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
    EXPECT_TRUE(result.mask.empty());
}

TEST(HSVSkinSegmenterTest, SingleChannelImageIsInvalid) {
    HSVSkinSegmenter segmenter;
    Types::Image gray(5, 5, CV_8UC1, cv::Scalar(180));

    Domain::SegmentationResult result = segmenter.segment(gray);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST(HSVSkinSegmenterTest, BoundsAreInclusive) {
    HSVSkinSegmenter segmenter;

    // Each pixel sits on or just past one HSV bound; the other channels are well inside
    struct Boundary {
        Types::RGBColor rgb;
        bool skin;
        const char* label;
    };
    const std::vector<Boundary> boundaries = {
        {Types::RGBColor(70, 0, 0), true, "V = 70"},
        {Types::RGBColor(69, 0, 0), false, "V = 69"},
        {Types::RGBColor(255, 235, 235), true, "S = 20"},
        {Types::RGBColor(255, 236, 236), false, "S = 19"},
        {Types::RGBColor(255, 0, 0), true, "H = 0"},
        {Types::RGBColor(255, 170, 0), true, "H = 20"},
        {Types::RGBColor(255, 179, 0), false, "H = 21"},
    };

    Types::Image image(1, static_cast<int>(boundaries.size()), CV_8UC3);
    for (size_t i = 0; i < boundaries.size(); ++i) {
        const Types::RGBColor& rgb = boundaries[i].rgb;
        image.at<cv::Vec3b>(0, static_cast<int>(i)) = cv::Vec3b(rgb[2], rgb[1], rgb[0]);
    }

    Domain::SegmentationResult result = segmenter.segment(image);
    ASSERT_TRUE(result.success);

    for (size_t i = 0; i < boundaries.size(); ++i) {
        EXPECT_EQ(result.mask.at<uchar>(0, static_cast<int>(i)) == 255, boundaries[i].skin)
            << boundaries[i].label;
    }
}

TEST(HSVSkinSegmenterTest, InputIsNotModified) {
    HSVSkinSegmenter segmenter;
    Types::Image image = Testing::makeSplitImage(6, 6, Testing::SKIN_RGB, Testing::BLUE_RGB);
    Types::Image original = image.clone();

    segmenter.segment(image);

    EXPECT_TRUE(Testing::imagesEqual(image, original));
}
