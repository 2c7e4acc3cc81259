#pragma once

#include <shared/types/Common.hpp>

namespace SkinTone::Domain {

// Multiplicative factors applied to the S and V channels of skin pixels
struct ToneAdjustment {
    double valueFactor = 1.0;
    double saturationFactor = 1.0;

    static ToneAdjustment forBand(Types::ToneBand band) {
        switch (band) {
            case Types::ToneBand::Fair:
                return {1.3, 0.7};
            case Types::ToneBand::Light:
                return {1.2, 0.8};
            case Types::ToneBand::Medium:
                return {1.0, 1.0};
            case Types::ToneBand::Dark:
                return {0.8, 1.2};
            case Types::ToneBand::Deep:
                return {0.6, 1.3};
        }
        return {1.0, 1.0};
    }
};

}  // namespace SkinTone::Domain
