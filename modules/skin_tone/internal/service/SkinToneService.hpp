#pragma once

#include "../../interface/ISkinToneService.hpp"
#include "../advice/ColorAdvisor.hpp"
#include "../correction/ToneTransformer.hpp"
#include "../processing/ToneAnalyzer.hpp"
#include "../segmentation/ISegmenter.hpp"
#include "../storage/ImageStore.hpp"
#include <memory>

namespace SkinTone::Internal::Service {

// Holds only immutable collaborators, so one instance may serve concurrent
// callers as long as each passes its own session.
class SkinToneService : public Interface::ISkinToneService {
  public:
    explicit SkinToneService(std::shared_ptr<const Interface::IConfiguration> config,
                             std::shared_ptr<const Segmentation::ISegmenter> segmenter = nullptr);

    Domain::SegmentationResult segment(const Types::Image& image) const override;

    Domain::ToneAnalysis analyzeTone(const Types::Image& image) const override;

    Domain::ToneTransformResult applyTone(const Types::Image& image, Types::ToneBand target) const override;
    Domain::ToneTransformResult applyTone(const Types::Image& image, const std::string& target) const override;

    Domain::Recommendation recommend(Types::ToneBand band) const override;
    Domain::Recommendation recommend(const std::string& band) const override;

    std::vector<Types::ColorCode> generateComplementaryColors(const Types::RGBColor& baseColor,
                                                              int count = 4) const override;

    Domain::ToneAnalysis detectFromFile(Domain::ToneSession& session,
                                        const std::string& imagePath) const override;
    Domain::ToneAnalysis detectFromUpload(Domain::ToneSession& session,
                                          const std::vector<uchar>& imageData) const override;

    Interface::ModifyResult modifySessionImage(Domain::ToneSession& session,
                                               Types::ToneBand target) const override;
    Interface::ModifyResult modifySessionImage(Domain::ToneSession& session,
                                               const std::string& target) const override;

    std::shared_ptr<const Interface::IConfiguration> getConfiguration() const override { return config_; }

  private:
    std::shared_ptr<const Interface::IConfiguration> config_;
    std::shared_ptr<const Segmentation::ISegmenter> segmenter_;
    Processing::ToneAnalyzer analyzer_;
    Correction::ToneTransformer transformer_;
    Advice::ColorAdvisor advisor_;
    Storage::ImageStore store_;
};

}  // namespace SkinTone::Internal::Service
