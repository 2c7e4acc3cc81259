#include "Configuration.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace SkinTone::Internal::Config {

namespace {

const char* const KEY_APP_NAME = "app_name";
const char* const KEY_APP_VERSION = "app_version";
const char* const KEY_APP_ENV = "app_env";
const char* const KEY_DEBUG = "debug";
const char* const KEY_UPLOAD_FOLDER = "upload_folder";
const char* const KEY_MAX_CONTENT_LENGTH = "max_content_length";
const char* const KEY_ALLOWED_EXTENSIONS = "allowed_extensions";
const char* const KEY_LOG_LEVEL = "log_level";

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool parseBool(const std::string& text, bool& out) {
    std::string value = toLower(trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

bool isKnownLogLevel(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "DEBUG" || upper == "INFO" || upper == "WARN" || upper == "WARNING" ||
           upper == "ERROR";
}

}  // namespace

Configuration::Configuration() {
    reset();
}

void Configuration::reset() {
    appName_ = "Skin Tone Color Advisor";
    appVersion_ = "1.0.0";
    environment_ = "development";
    debug_ = false;
    uploadFolder_ = "uploads";
    maxContentLength_ = DEFAULT_MAX_CONTENT_LENGTH;
    allowedExtensions_ = {"png", "jpg", "jpeg"};
    logLevel_ = "INFO";
}

std::string Configuration::normalizeExtension(const std::string& extension) {
    std::string normalized = toLower(trim(extension));
    if (!normalized.empty() && normalized.front() == '.') normalized.erase(0, 1);
    return normalized;
}

void Configuration::setAllowedExtensions(const std::vector<std::string>& extensions) {
    allowedExtensions_.clear();
    for (const auto& extension : extensions) {
        std::string normalized = normalizeExtension(extension);
        if (normalized.empty()) continue;
        if (std::find(allowedExtensions_.begin(), allowedExtensions_.end(), normalized) ==
            allowedExtensions_.end()) {
            allowedExtensions_.push_back(normalized);
        }
    }
}

bool Configuration::isExtensionAllowed(const std::string& extension) const {
    std::string normalized = normalizeExtension(extension);
    return std::find(allowedExtensions_.begin(), allowedExtensions_.end(), normalized) !=
           allowedExtensions_.end();
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open configuration file for reading: ", filename);
            return false;
        }

        bool loaded = readFrom(fs);
        if (loaded) LOG_INFO("Configuration loaded from ", filename);
        return loaded;

    } catch (const cv::Exception& e) {
        LOG_ERROR("Error loading configuration from ", filename, ": ", e.what());
        return false;
    }
}

bool Configuration::saveToFile(const std::string& filename) const {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open configuration file for writing: ", filename);
            return false;
        }

        writeTo(fs);
        fs.release();

        LOG_INFO("Configuration saved to ", filename);
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("Error saving configuration to ", filename, ": ", e.what());
        return false;
    }
}

bool Configuration::loadFromString(const std::string& configString) {
    if (trim(configString).empty()) {
        LOG_ERROR("Configuration string is empty");
        return false;
    }

    try {
        cv::FileStorage fs(configString, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot parse configuration string");
            return false;
        }
        return readFrom(fs);

    } catch (const cv::Exception& e) {
        LOG_ERROR("Error parsing configuration string: ", e.what());
        return false;
    }
}

std::string Configuration::saveToString() const {
    try {
        cv::FileStorage fs(".yml",
                           cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_YAML);
        writeTo(fs);
        return fs.releaseAndGetString();

    } catch (const cv::Exception& e) {
        LOG_ERROR("Error serializing configuration: ", e.what());
        return "";
    }
}

bool Configuration::readFrom(cv::FileStorage& fs) {
    // Read into a copy so a malformed file leaves the current settings intact
    Configuration loaded(*this);

    cv::FileNode node = fs[KEY_APP_NAME];
    if (!node.empty()) loaded.appName_ = static_cast<std::string>(node);

    node = fs[KEY_APP_VERSION];
    if (!node.empty()) loaded.appVersion_ = static_cast<std::string>(node);

    node = fs[KEY_APP_ENV];
    if (!node.empty()) loaded.environment_ = static_cast<std::string>(node);

    node = fs[KEY_DEBUG];
    if (!node.empty()) {
        if (node.isString()) {
            if (!parseBool(static_cast<std::string>(node), loaded.debug_)) {
                LOG_ERROR("Invalid value for ", KEY_DEBUG);
                return false;
            }
        } else {
            loaded.debug_ = static_cast<int>(node) != 0;
        }
    }

    node = fs[KEY_UPLOAD_FOLDER];
    if (!node.empty()) loaded.uploadFolder_ = static_cast<std::string>(node);

    node = fs[KEY_MAX_CONTENT_LENGTH];
    if (!node.empty()) {
        double bytes = static_cast<double>(node);
        if (bytes <= 0) {
            LOG_ERROR("Invalid value for ", KEY_MAX_CONTENT_LENGTH, ": ", bytes);
            return false;
        }
        loaded.maxContentLength_ = static_cast<std::size_t>(bytes);
    }

    node = fs[KEY_ALLOWED_EXTENSIONS];
    if (!node.empty()) {
        std::vector<std::string> extensions;
        if (node.isSeq()) {
            for (const auto& item : node) extensions.push_back(static_cast<std::string>(item));
        } else {
            std::stringstream ss(static_cast<std::string>(node));
            std::string item;
            while (std::getline(ss, item, ',')) extensions.push_back(item);
        }
        loaded.setAllowedExtensions(extensions);
    }

    node = fs[KEY_LOG_LEVEL];
    if (!node.empty()) loaded.logLevel_ = static_cast<std::string>(node);

    *this = loaded;
    return true;
}

void Configuration::writeTo(cv::FileStorage& fs) const {
    fs << KEY_APP_NAME << appName_;
    fs << KEY_APP_VERSION << appVersion_;
    fs << KEY_APP_ENV << environment_;
    fs << KEY_DEBUG << static_cast<int>(debug_);
    fs << KEY_UPLOAD_FOLDER << uploadFolder_;
    fs << KEY_MAX_CONTENT_LENGTH << static_cast<double>(maxContentLength_);

    fs << KEY_ALLOWED_EXTENSIONS << "[";
    for (const auto& extension : allowedExtensions_) fs << extension;
    fs << "]";

    fs << KEY_LOG_LEVEL << logLevel_;
}

bool Configuration::setParameter(const std::string& key, const std::string& value) {
    if (key == KEY_APP_NAME) {
        appName_ = value;
    } else if (key == KEY_APP_VERSION) {
        appVersion_ = value;
    } else if (key == KEY_APP_ENV) {
        environment_ = value;
    } else if (key == KEY_DEBUG) {
        if (!parseBool(value, debug_)) {
            LOG_WARN("Invalid boolean for ", key, ": ", value);
            return false;
        }
    } else if (key == KEY_UPLOAD_FOLDER) {
        uploadFolder_ = value;
    } else if (key == KEY_MAX_CONTENT_LENGTH) {
        try {
            long long bytes = std::stoll(value);
            if (bytes <= 0) throw std::out_of_range(value);
            maxContentLength_ = static_cast<std::size_t>(bytes);
        } catch (const std::exception&) {
            LOG_WARN("Invalid byte count for ", key, ": ", value);
            return false;
        }
    } else if (key == KEY_ALLOWED_EXTENSIONS) {
        std::vector<std::string> extensions;
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) extensions.push_back(item);
        setAllowedExtensions(extensions);
    } else if (key == KEY_LOG_LEVEL) {
        logLevel_ = value;
    } else {
        LOG_WARN("Unknown configuration parameter: ", key);
        return false;
    }
    return true;
}

std::string Configuration::getParameter(const std::string& key) const {
    auto parameters = getAllParameters();
    auto it = parameters.find(key);
    return it != parameters.end() ? it->second : "";
}

std::map<std::string, std::string> Configuration::getAllParameters() const {
    std::string extensions;
    for (size_t i = 0; i < allowedExtensions_.size(); ++i) {
        if (i > 0) extensions += ",";
        extensions += allowedExtensions_[i];
    }

    return {
        {KEY_APP_NAME, appName_},
        {KEY_APP_VERSION, appVersion_},
        {KEY_APP_ENV, environment_},
        {KEY_DEBUG, debug_ ? "true" : "false"},
        {KEY_UPLOAD_FOLDER, uploadFolder_},
        {KEY_MAX_CONTENT_LENGTH, std::to_string(maxContentLength_)},
        {KEY_ALLOWED_EXTENSIONS, extensions},
        {KEY_LOG_LEVEL, logLevel_},
    };
}

bool Configuration::isValid() const {
    return !uploadFolder_.empty() && maxContentLength_ > 0 && !allowedExtensions_.empty() &&
           isKnownLogLevel(logLevel_);
}

void Configuration::validate() {
    if (uploadFolder_.empty()) {
        LOG_WARN("Upload folder is empty, using 'uploads'");
        uploadFolder_ = "uploads";
    }
    if (maxContentLength_ == 0) {
        LOG_WARN("Max content length is zero, using ", DEFAULT_MAX_CONTENT_LENGTH, " bytes");
        maxContentLength_ = DEFAULT_MAX_CONTENT_LENGTH;
    }
    if (allowedExtensions_.empty()) {
        LOG_WARN("No allowed extensions configured, using png/jpg/jpeg");
        allowedExtensions_ = {"png", "jpg", "jpeg"};
    }
    if (!isKnownLogLevel(logLevel_)) {
        LOG_WARN("Unknown log level '", logLevel_, "', using INFO");
        logLevel_ = "INFO";
    }
}

}  // namespace SkinTone::Internal::Config

namespace SkinTone::Interface {

std::unique_ptr<IConfiguration> createDefaultConfiguration() {
    return std::make_unique<Internal::Config::Configuration>();
}

}  // namespace SkinTone::Interface
