#include "SkinToneService.hpp"
#include "../config/Configuration.hpp"
#include "../segmentation/HSVSkinSegmenter.hpp"
#include "../../interface/SkinToneAPI.hpp"
#include <shared/utils/Logger.hpp>

namespace SkinTone::Internal::Service {

namespace {

std::shared_ptr<const Interface::IConfiguration> orDefault(
    std::shared_ptr<const Interface::IConfiguration> config) {
    if (config) return config;
    return std::make_shared<Config::Configuration>();
}

std::shared_ptr<const Segmentation::ISegmenter> orDefault(
    std::shared_ptr<const Segmentation::ISegmenter> segmenter) {
    if (segmenter) return segmenter;
    return std::make_shared<Segmentation::HSVSkinSegmenter>();
}

Interface::ModifyResult modifyFailure(Types::ErrorKind error, const std::string& message) {
    Interface::ModifyResult result;
    result.error = error;
    result.errorMessage = message;
    return result;
}

}  // namespace

SkinToneService::SkinToneService(std::shared_ptr<const Interface::IConfiguration> config,
                                 std::shared_ptr<const Segmentation::ISegmenter> segmenter)
    : config_(orDefault(std::move(config))),
      segmenter_(orDefault(std::move(segmenter))),
      analyzer_(segmenter_),
      transformer_(segmenter_),
      advisor_(),
      store_(config_) {
    LOG_INFO(config_->getAppName(), " ", config_->getAppVersion(), " service ready (",
             segmenter_->getName(), " segmentation, uploads in ", config_->getUploadFolder(), ")");
}

Domain::SegmentationResult SkinToneService::segment(const Types::Image& image) const {
    return segmenter_->segment(image);
}

Domain::ToneAnalysis SkinToneService::analyzeTone(const Types::Image& image) const {
    return analyzer_.analyze(image);
}

Domain::ToneTransformResult SkinToneService::applyTone(const Types::Image& image,
                                                       Types::ToneBand target) const {
    return transformer_.applyTone(image, target);
}

Domain::ToneTransformResult SkinToneService::applyTone(const Types::Image& image,
                                                       const std::string& target) const {
    return transformer_.applyTone(image, target);
}

Domain::Recommendation SkinToneService::recommend(Types::ToneBand band) const {
    return advisor_.recommend(band);
}

Domain::Recommendation SkinToneService::recommend(const std::string& band) const {
    return advisor_.recommend(band);
}

std::vector<Types::ColorCode> SkinToneService::generateComplementaryColors(
    const Types::RGBColor& baseColor, int count) const {
    return advisor_.generateComplementaryColors(baseColor, count);
}

Domain::ToneAnalysis SkinToneService::detectFromFile(Domain::ToneSession& session,
                                                     const std::string& imagePath) const {
    session.setImagePath(imagePath);

    Storage::ImageStore::LoadResult loaded = store_.load(imagePath);
    if (!loaded.success) {
        Domain::ToneAnalysis failure =
            Domain::ToneAnalysis::createFailure(loaded.error, loaded.errorMessage);
        session.setAnalysis(failure);
        return failure;
    }

    Domain::ToneAnalysis analysis = analyzer_.analyze(loaded.image);
    session.setAnalysis(analysis);
    return analysis;
}

Domain::ToneAnalysis SkinToneService::detectFromUpload(Domain::ToneSession& session,
                                                       const std::vector<uchar>& imageData) const {
    Storage::ImageStore::SaveResult saved = store_.saveUpload(imageData);
    if (!saved.success) {
        session.reset();
        return Domain::ToneAnalysis::createFailure(saved.error, saved.errorMessage);
    }

    return detectFromFile(session, saved.path);
}

Interface::ModifyResult SkinToneService::modifySessionImage(Domain::ToneSession& session,
                                                            const std::string& target) const {
    std::optional<Types::ToneBand> band = Types::parseToneBand(target);
    if (!band) {
        LOG_ERROR("Invalid target tone: ", target);
        return modifyFailure(Types::ErrorKind::InvalidTargetTone, "Invalid target tone: " + target);
    }
    return modifySessionImage(session, *band);
}

Interface::ModifyResult SkinToneService::modifySessionImage(Domain::ToneSession& session,
                                                            Types::ToneBand target) const {
    if (!session.hasImage()) {
        LOG_WARN("Tone modification requested without an image");
        return modifyFailure(Types::ErrorKind::InvalidImage, "No image in session");
    }

    session.selectTone(target);

    Storage::ImageStore::LoadResult loaded = store_.load(session.getImagePath());
    if (!loaded.success) return modifyFailure(loaded.error, loaded.errorMessage);

    Domain::ToneTransformResult transformed = transformer_.applyTone(loaded.image, target);
    if (!transformed.success) return modifyFailure(transformed.error, transformed.errorMessage);

    Storage::ImageStore::SaveResult saved =
        store_.saveModified(transformed.image, session.getImagePath(), target);
    if (!saved.success) return modifyFailure(saved.error, saved.errorMessage);

    session.setModifiedImagePath(saved.path);

    Interface::ModifyResult result;
    result.success = true;
    result.outputPath = saved.path;
    result.targetTone = target;
    result.modifiedPixels = transformed.modifiedPixels;
    return result;
}

}  // namespace SkinTone::Internal::Service

namespace SkinTone::Interface {

std::unique_ptr<ISkinToneService> createSkinToneService(std::shared_ptr<const IConfiguration> config) {
    return std::make_unique<Internal::Service::SkinToneService>(std::move(config));
}

std::string describeError(Types::ErrorKind error) {
    switch (error) {
        case Types::ErrorKind::None:
            return "";
        case Types::ErrorKind::InvalidImage:
            return "Could not read the image";
        case Types::ErrorKind::NoSkinDetected:
            return "No skin detected in the image";
        case Types::ErrorKind::InvalidTargetTone:
            return "Invalid target tone";
        case Types::ErrorKind::StorageFailure:
            return "Could not save the image";
    }
    return "An unexpected error occurred";
}

}  // namespace SkinTone::Interface

namespace SkinTone::SimpleAPI {

Domain::ToneAnalysis detectSkinTone(const std::string& imagePath) {
    Domain::ToneSession session;
    return Interface::createSkinToneService()->detectFromFile(session, imagePath);
}

Interface::ModifyResult modifySkinTone(const std::string& imagePath, const std::string& targetTone) {
    Domain::ToneSession session(imagePath);
    return Interface::createSkinToneService()->modifySessionImage(session, targetTone);
}

Domain::Recommendation getColorRecommendations(const std::string& toneName) {
    return Internal::Advice::ColorAdvisor().recommend(toneName);
}

}  // namespace SkinTone::SimpleAPI
