#pragma once

#include "../../interface/IConfiguration.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace SkinTone::Internal::Config {

// IConfiguration backed by cv::FileStorage. The file format (YAML, JSON or XML)
// follows the file extension; in-memory strings may use any of the three.
class Configuration : public Interface::IConfiguration {
  public:
    static constexpr std::size_t DEFAULT_MAX_CONTENT_LENGTH = 16 * 1024 * 1024;

    Configuration();

    std::string getAppName() const override { return appName_; }
    std::string getAppVersion() const override { return appVersion_; }
    std::string getEnvironment() const override { return environment_; }
    bool isDebug() const override { return debug_; }
    void setDebug(bool enabled) override { debug_ = enabled; }

    std::string getUploadFolder() const override { return uploadFolder_; }
    void setUploadFolder(const std::string& folder) override { uploadFolder_ = folder; }

    std::size_t getMaxContentLength() const override { return maxContentLength_; }
    void setMaxContentLength(std::size_t bytes) override { maxContentLength_ = bytes; }

    std::vector<std::string> getAllowedExtensions() const override { return allowedExtensions_; }
    void setAllowedExtensions(const std::vector<std::string>& extensions) override;
    bool isExtensionAllowed(const std::string& extension) const override;

    std::string getLogLevel() const override { return logLevel_; }
    void setLogLevel(const std::string& level) override { logLevel_ = level; }

    bool loadFromFile(const std::string& filename) override;
    bool saveToFile(const std::string& filename) const override;
    bool loadFromString(const std::string& configString) override;
    std::string saveToString() const override;

    bool setParameter(const std::string& key, const std::string& value) override;
    std::string getParameter(const std::string& key) const override;
    std::map<std::string, std::string> getAllParameters() const override;

    bool isValid() const override;
    void reset() override;
    void validate() override;

    // Lowercase, leading dot removed
    static std::string normalizeExtension(const std::string& extension);

  private:
    std::string appName_;
    std::string appVersion_;
    std::string environment_;
    bool debug_;
    std::string uploadFolder_;
    std::size_t maxContentLength_;
    std::vector<std::string> allowedExtensions_;
    std::string logLevel_;

    bool readFrom(cv::FileStorage& fs);
    void writeTo(cv::FileStorage& fs) const;
};

}  // namespace SkinTone::Internal::Config
