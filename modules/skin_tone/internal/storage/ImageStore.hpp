#pragma once

#include "../../interface/IConfiguration.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <memory>
#include <string>
#include <vector>

namespace SkinTone::Internal::Storage {

// Decodes images coming into the application and writes the ones going out.
// Names and limits come from the configuration given at construction.
class ImageStore {
  public:
    struct LoadResult {
        Types::Image image;
        bool success = false;
        Types::ErrorKind error = Types::ErrorKind::None;
        std::string errorMessage;
    };

    struct SaveResult {
        std::string path;
        bool success = false;
        Types::ErrorKind error = Types::ErrorKind::None;
        std::string errorMessage;
    };

    explicit ImageStore(std::shared_ptr<const Interface::IConfiguration> config);

    LoadResult decode(const std::vector<uchar>& bytes) const;
    LoadResult load(const std::string& path) const;

    // Writes upload_<YYYYmmdd_HHMMSS>_<8 hex>.jpg into the upload folder
    SaveResult saveUpload(const std::vector<uchar>& bytes) const;

    // Writes <stem>_<Tone>_<YYYYmmdd_HHMMSS><ext> into the upload folder
    SaveResult saveModified(const Types::Image& image, const std::string& sourcePath,
                            Types::ToneBand tone) const;

    static std::string makeUploadFilename();
    static std::string makeModifiedFilename(const std::string& sourcePath, Types::ToneBand tone);

  private:
    std::shared_ptr<const Interface::IConfiguration> config_;

    SaveResult write(const Types::Image& image, const std::string& filename) const;
    bool ensureUploadFolder(std::string& errorMessage) const;

    static std::string timestamp();
    static std::string randomHexId(int length);
};

}  // namespace SkinTone::Internal::Storage
