#include <gtest/gtest.h>

#include "TestImages.hpp"
#include "../modules/skin_tone/internal/config/Configuration.hpp"
#include "../modules/skin_tone/internal/storage/ImageStore.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <regex>

using namespace SkinTone;
using Internal::Storage::ImageStore;

namespace {

std::vector<uchar> encode(const Types::Image& image, const std::string& extension) {
    std::vector<uchar> bytes;
    cv::imencode(extension, image, bytes);
    return bytes;
}

class ImageStoreTest : public ::testing::Test {
  protected:
    void SetUp() override {
        config_ = std::make_shared<Internal::Config::Configuration>();
        config_->setUploadFolder((dir_.path() / "uploads").string());
    }

    Testing::TempDirectory dir_;
    std::shared_ptr<Internal::Config::Configuration> config_;
};

}  // namespace

TEST_F(ImageStoreTest, DecodesEncodedImage) {
    ImageStore store(config_);
    Types::Image image = Testing::makeSplitImage(12, 16, Testing::SKIN_RGB, Testing::BLUE_RGB);

    ImageStore::LoadResult result = store.decode(encode(image, ".png"));

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(Testing::imagesEqual(result.image, image));
}

TEST_F(ImageStoreTest, RejectsEmptyData) {
    ImageStore store(config_);

    ImageStore::LoadResult result = store.decode({});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST_F(ImageStoreTest, RejectsUndecodableData) {
    ImageStore store(config_);
    std::vector<uchar> garbage = {'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};

    ImageStore::LoadResult result = store.decode(garbage);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST_F(ImageStoreTest, RejectsOversizedData) {
    config_->setMaxContentLength(16);
    ImageStore store(config_);

    ImageStore::LoadResult result = store.decode(encode(Testing::makeUniformImage(8, 8, Testing::SKIN_RGB), ".png"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST_F(ImageStoreTest, LoadRejectsDisallowedExtension) {
    ImageStore store(config_);

    ImageStore::LoadResult result = store.load(dir_.file("photo.gif"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST_F(ImageStoreTest, LoadRejectsMissingFile) {
    ImageStore store(config_);

    ImageStore::LoadResult result = store.load(dir_.file("missing.png"));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
}

TEST_F(ImageStoreTest, SaveUploadCreatesUniqueFile) {
    ImageStore store(config_);
    std::vector<uchar> bytes = encode(Testing::makeUniformImage(10, 10, Testing::SKIN_RGB), ".png");

    ImageStore::SaveResult first = store.saveUpload(bytes);
    ImageStore::SaveResult second = store.saveUpload(bytes);

    ASSERT_TRUE(first.success);
    ASSERT_TRUE(second.success);
    EXPECT_NE(first.path, second.path);
    EXPECT_TRUE(std::filesystem::exists(first.path));

    std::filesystem::path saved(first.path);
    EXPECT_EQ(saved.parent_path(), std::filesystem::path(config_->getUploadFolder()));
    EXPECT_TRUE(std::regex_match(saved.filename().string(),
                                 std::regex("upload_[0-9]{8}_[0-9]{6}_[0-9a-f]{8}\\.jpg")))
        << saved.filename();
}

TEST_F(ImageStoreTest, SaveUploadRejectsUndecodableData) {
    ImageStore store(config_);

    ImageStore::SaveResult result = store.saveUpload({'x', 'y', 'z'});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorKind::InvalidImage);
    EXPECT_FALSE(std::filesystem::exists(config_->getUploadFolder()));
}

TEST_F(ImageStoreTest, ModifiedFilenameKeepsStemAndExtension) {
    std::string name = ImageStore::makeModifiedFilename("/photos/portrait.png", Types::ToneBand::Light);

    EXPECT_TRUE(std::regex_match(name, std::regex("portrait_Light_[0-9]{8}_[0-9]{6}\\.png"))) << name;
}

TEST_F(ImageStoreTest, SaveModifiedWritesReadableImage) {
    ImageStore store(config_);
    Types::Image image = Testing::makeSplitImage(6, 6, Testing::SKIN_RGB, Testing::BLUE_RGB);

    ImageStore::SaveResult saved = store.saveModified(image, dir_.file("portrait.png"), Types::ToneBand::Dark);
    ASSERT_TRUE(saved.success);

    ImageStore::LoadResult loaded = store.load(saved.path);
    ASSERT_TRUE(loaded.success);
    EXPECT_TRUE(Testing::imagesEqual(loaded.image, image));
}

TEST_F(ImageStoreTest, SaveModifiedRejectsEmptyImage) {
    ImageStore store(config_);

    ImageStore::SaveResult saved = store.saveModified(Types::Image(), dir_.file("portrait.png"), Types::ToneBand::Dark);

    EXPECT_FALSE(saved.success);
    EXPECT_EQ(saved.error, Types::ErrorKind::InvalidImage);
}
