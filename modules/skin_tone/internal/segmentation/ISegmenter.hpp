#pragma once

#include "../domain/ToneAnalysis.hpp"
#include <shared/types/Common.hpp>
#include <string>

namespace SkinTone::Internal::Segmentation {

class ISegmenter {
  public:
    virtual ~ISegmenter() = default;

    virtual Domain::SegmentationResult segment(const Types::Image& image) const = 0;

    virtual std::string getName() const = 0;
};

}  // namespace SkinTone::Internal::Segmentation
