#pragma once

#include "ToneAnalysis.hpp"
#include <shared/types/Common.hpp>
#include <optional>
#include <string>
#include <utility>

namespace SkinTone::Domain {

// State of one user interaction: the image being worked on, what was detected in
// it and the tone picked for modification. Owned by the caller and passed to each
// service call; nothing here is shared between sessions.
class ToneSession {
  public:
    ToneSession() = default;
    explicit ToneSession(std::string imagePath) : imagePath_(std::move(imagePath)) {}

    bool hasImage() const { return !imagePath_.empty(); }
    const std::string& getImagePath() const { return imagePath_; }

    // A new image invalidates everything derived from the previous one
    void setImagePath(const std::string& path) {
        imagePath_ = path;
        analysis_.reset();
        modifiedImagePath_.reset();
    }

    const std::optional<ToneAnalysis>& getAnalysis() const { return analysis_; }
    void setAnalysis(const ToneAnalysis& analysis) { analysis_ = analysis; }

    std::optional<Types::ToneBand> getDetectedTone() const {
        if (analysis_ && analysis_->isSuccess()) return analysis_->getTone();
        return std::nullopt;
    }

    const std::optional<Types::ToneBand>& getSelectedTone() const { return selectedTone_; }
    void selectTone(Types::ToneBand tone) { selectedTone_ = tone; }

    const std::optional<std::string>& getModifiedImagePath() const { return modifiedImagePath_; }
    void setModifiedImagePath(const std::string& path) { modifiedImagePath_ = path; }

    void reset() {
        imagePath_.clear();
        analysis_.reset();
        selectedTone_.reset();
        modifiedImagePath_.reset();
    }

  private:
    std::string imagePath_;
    std::optional<ToneAnalysis> analysis_;
    std::optional<Types::ToneBand> selectedTone_;
    std::optional<std::string> modifiedImagePath_;
};

}  // namespace SkinTone::Domain
