#pragma once

#include "IConfiguration.hpp"
#include "../internal/domain/Recommendation.hpp"
#include "../internal/domain/ToneAnalysis.hpp"
#include "../internal/domain/ToneSession.hpp"
#include <shared/types/Common.hpp>
#include <memory>
#include <string>
#include <vector>

namespace SkinTone::Interface {

struct ModifyResult {
    bool success = false;
    Types::ErrorKind error = Types::ErrorKind::None;
    std::string errorMessage;

    std::string outputPath;
    Types::ToneBand targetTone = Types::ToneBand::Medium;
    int modifiedPixels = 0;
};

class ISkinToneService {
  public:
    virtual ~ISkinToneService() = default;

    // Core pipeline on in-memory images
    virtual Domain::SegmentationResult segment(const Types::Image& image) const = 0;

    virtual Domain::ToneAnalysis analyzeTone(const Types::Image& image) const = 0;

    virtual Domain::ToneTransformResult applyTone(const Types::Image& image,
                                                  Types::ToneBand target) const = 0;
    virtual Domain::ToneTransformResult applyTone(const Types::Image& image,
                                                  const std::string& target) const = 0;

    // Recommendations
    virtual Domain::Recommendation recommend(Types::ToneBand band) const = 0;
    virtual Domain::Recommendation recommend(const std::string& band) const = 0;

    virtual std::vector<Types::ColorCode> generateComplementaryColors(const Types::RGBColor& baseColor,
                                                                      int count = 4) const = 0;

    // Session flows: load or store images through the configured upload folder
    // and record the outcome in the caller's session
    virtual Domain::ToneAnalysis detectFromFile(Domain::ToneSession& session,
                                                const std::string& imagePath) const = 0;
    virtual Domain::ToneAnalysis detectFromUpload(Domain::ToneSession& session,
                                                  const std::vector<uchar>& imageData) const = 0;

    virtual ModifyResult modifySessionImage(Domain::ToneSession& session,
                                            Types::ToneBand target) const = 0;
    virtual ModifyResult modifySessionImage(Domain::ToneSession& session,
                                            const std::string& target) const = 0;

    virtual std::shared_ptr<const IConfiguration> getConfiguration() const = 0;
};

// Factory functions
std::unique_ptr<ISkinToneService> createSkinToneService(
    std::shared_ptr<const IConfiguration> config = nullptr);

// User-facing text for an error kind
std::string describeError(Types::ErrorKind error);

}  // namespace SkinTone::Interface
