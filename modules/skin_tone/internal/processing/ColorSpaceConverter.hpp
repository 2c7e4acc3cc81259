#pragma once

#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstdio>

namespace SkinTone::Internal::Processing {

// All HSV data in this project uses the OpenCV 8-bit scale: H in [0,179]
// (degrees halved), S and V in [0,255]. Segmentation bounds, tone classification
// and tone adjustment all go through this class so the scale cannot diverge.
class ColorSpaceConverter {
  public:
    // Floating-point HSV with every component in [0,1]
    struct UnitHSV {
        double h = 0.0;
        double s = 0.0;
        double v = 0.0;
    };

    static bool isColorImage(const Types::Image& image) {
        return !image.empty() && image.type() == CV_8UC3;
    }

    Types::Image bgrToHsv(const Types::Image& bgrImage) const {
        if (!isColorImage(bgrImage)) {
            LOG_ERROR("Expected a non-empty 8-bit 3-channel image");
            return Types::Image();
        }

        Types::Image hsvImage;
        cv::cvtColor(bgrImage, hsvImage, cv::COLOR_BGR2HSV);
        return hsvImage;
    }

    Types::Image hsvToBgr(const Types::Image& hsvImage) const {
        if (!isColorImage(hsvImage)) {
            LOG_ERROR("Expected a non-empty 8-bit 3-channel HSV image");
            return Types::Image();
        }

        Types::Image bgrImage;
        cv::cvtColor(hsvImage, bgrImage, cv::COLOR_HSV2BGR);
        return bgrImage;
    }

    // Single colour conversion, identical to the per-pixel image conversion
    Types::HSVColor rgbToHsv(const Types::RGBColor& rgb) const {
        cv::Mat pixel(1, 1, CV_8UC3,
                      cv::Scalar(Types::clampChannel(rgb[0]), Types::clampChannel(rgb[1]),
                                 Types::clampChannel(rgb[2])));
        cv::Mat hsv;
        cv::cvtColor(pixel, hsv, cv::COLOR_RGB2HSV);

        const cv::Vec3b& value = hsv.at<cv::Vec3b>(0, 0);
        return Types::HSVColor(value[0], value[1], value[2]);
    }

    static Types::RGBColor bgrToRgb(const cv::Vec3b& bgr) {
        return Types::RGBColor(bgr[2], bgr[1], bgr[0]);
    }

    // Continuous RGB -> HSV on unit ranges, hue as a fraction of the full circle
    static UnitHSV rgbToUnitHsv(const Types::RGBColor& rgb) {
        double r = rgb[0] / 255.0;
        double g = rgb[1] / 255.0;
        double b = rgb[2] / 255.0;

        double maxc = std::max({r, g, b});
        double minc = std::min({r, g, b});

        UnitHSV hsv;
        hsv.v = maxc;
        if (minc == maxc) return hsv;

        double delta = maxc - minc;
        hsv.s = delta / maxc;

        double rc = (maxc - r) / delta;
        double gc = (maxc - g) / delta;
        double bc = (maxc - b) / delta;

        double h;
        if (r == maxc) {
            h = bc - gc;
        } else if (g == maxc) {
            h = 2.0 + rc - bc;
        } else {
            h = 4.0 + gc - rc;
        }

        hsv.h = h / 6.0 - std::floor(h / 6.0);
        return hsv;
    }

    // Inverse of rgbToUnitHsv, components in [0,1]
    static cv::Vec3d unitHsvToRgb(const UnitHSV& hsv) {
        if (hsv.s == 0.0) return cv::Vec3d(hsv.v, hsv.v, hsv.v);

        int sector = static_cast<int>(hsv.h * 6.0);
        double f = hsv.h * 6.0 - sector;
        double p = hsv.v * (1.0 - hsv.s);
        double q = hsv.v * (1.0 - hsv.s * f);
        double t = hsv.v * (1.0 - hsv.s * (1.0 - f));

        switch (sector % 6) {
            case 0:
                return cv::Vec3d(hsv.v, t, p);
            case 1:
                return cv::Vec3d(q, hsv.v, p);
            case 2:
                return cv::Vec3d(p, hsv.v, t);
            case 3:
                return cv::Vec3d(p, q, hsv.v);
            case 4:
                return cv::Vec3d(t, p, hsv.v);
            default:
                return cv::Vec3d(hsv.v, p, q);
        }
    }

    // Lowercase "#rrggbb" from unit RGB, each channel truncated after scaling
    static Types::ColorCode toHexCode(const cv::Vec3d& unitRgb) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x",
                      Types::clampChannel(unitRgb[0] * 255.0),
                      Types::clampChannel(unitRgb[1] * 255.0),
                      Types::clampChannel(unitRgb[2] * 255.0));
        return Types::ColorCode(buffer);
    }
};

}  // namespace SkinTone::Internal::Processing
