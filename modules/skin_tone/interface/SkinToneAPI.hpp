#pragma once

// Main public API header - includes all interfaces
#include "IConfiguration.hpp"
#include "ISkinToneService.hpp"

// Common types for public API
#include <shared/types/Common.hpp>

// Version information
namespace SkinTone {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

// Simplified API for common use cases, using the default configuration
namespace SimpleAPI {

// Image path -> detected tone
Domain::ToneAnalysis detectSkinTone(const std::string& imagePath);

// Image path + tone name -> path of the modified copy in the upload folder
Interface::ModifyResult modifySkinTone(const std::string& imagePath, const std::string& targetTone);

// Tone name -> palettes; unknown names give the Medium palettes
Domain::Recommendation getColorRecommendations(const std::string& toneName);

}  // namespace SimpleAPI

}  // namespace SkinTone
