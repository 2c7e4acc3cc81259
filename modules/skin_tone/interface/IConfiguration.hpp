#pragma once

#include <shared/types/Common.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace SkinTone::Interface {

class IConfiguration {
  public:
    virtual ~IConfiguration() = default;

    // Application identity
    virtual std::string getAppName() const = 0;
    virtual std::string getAppVersion() const = 0;
    virtual std::string getEnvironment() const = 0;
    virtual bool isDebug() const = 0;
    virtual void setDebug(bool enabled) = 0;

    // Upload handling
    virtual std::string getUploadFolder() const = 0;
    virtual void setUploadFolder(const std::string& folder) = 0;

    virtual std::size_t getMaxContentLength() const = 0;
    virtual void setMaxContentLength(std::size_t bytes) = 0;

    virtual std::vector<std::string> getAllowedExtensions() const = 0;
    virtual void setAllowedExtensions(const std::vector<std::string>& extensions) = 0;
    virtual bool isExtensionAllowed(const std::string& extension) const = 0;

    // Logging
    virtual std::string getLogLevel() const = 0;
    virtual void setLogLevel(const std::string& level) = 0;

    // Configuration persistence
    virtual bool loadFromFile(const std::string& filename) = 0;
    virtual bool saveToFile(const std::string& filename) const = 0;
    virtual bool loadFromString(const std::string& configString) = 0;
    virtual std::string saveToString() const = 0;

    // Runtime configuration
    virtual bool setParameter(const std::string& key, const std::string& value) = 0;
    virtual std::string getParameter(const std::string& key) const = 0;
    virtual std::map<std::string, std::string> getAllParameters() const = 0;

    virtual bool isValid() const = 0;
    virtual void reset() = 0;
    virtual void validate() = 0;
};

// Factory function for creating default configuration
std::unique_ptr<IConfiguration> createDefaultConfiguration();

}  // namespace SkinTone::Interface
