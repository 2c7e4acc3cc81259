#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>
#include <algorithm>

namespace SkinTone::Types {

using Image = cv::Mat;   // CV_8UC3, BGR order
using Mask = cv::Mat;    // CV_8UC1, 255 = skin
using RGBColor = cv::Vec3i;
using HSVColor = cv::Vec3i;  // OpenCV 8-bit scale: H 0-179, S/V 0-255
using ColorCode = std::string;  // "#RRGGBB"

constexpr int TONE_BAND_COUNT = 5;

// Ordered by decreasing lightness
enum class ToneBand { Fair, Light, Medium, Dark, Deep };

constexpr std::array<ToneBand, TONE_BAND_COUNT> ALL_TONE_BANDS = {
    ToneBand::Fair, ToneBand::Light, ToneBand::Medium, ToneBand::Dark, ToneBand::Deep};

enum class ErrorKind { None, InvalidImage, NoSkinDetected, InvalidTargetTone, StorageFailure };

inline std::string toString(ToneBand band) {
    switch (band) {
        case ToneBand::Fair:
            return "Fair";
        case ToneBand::Light:
            return "Light";
        case ToneBand::Medium:
            return "Medium";
        case ToneBand::Dark:
            return "Dark";
        case ToneBand::Deep:
            return "Deep";
    }
    return "Medium";
}

// Exact, case-sensitive match against the five band names
inline std::optional<ToneBand> parseToneBand(const std::string& name) {
    for (ToneBand band : ALL_TONE_BANDS) {
        if (toString(band) == name) return band;
    }
    return std::nullopt;
}

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::InvalidImage:
            return "InvalidImage";
        case ErrorKind::NoSkinDetected:
            return "NoSkinDetected";
        case ErrorKind::InvalidTargetTone:
            return "InvalidTargetTone";
        case ErrorKind::StorageFailure:
            return "StorageFailure";
    }
    return "Unknown";
}

inline int clampChannel(double value) {
    return static_cast<int>(std::clamp(value, 0.0, 255.0));
}

}  // namespace SkinTone::Types
