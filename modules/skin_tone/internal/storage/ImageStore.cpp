#include "ImageStore.hpp"
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace SkinTone::Internal::Storage {

namespace {

template <typename Result>
Result makeError(Types::ErrorKind kind, const std::string& message) {
    Result result;
    result.error = kind;
    result.errorMessage = message;
    LOG_ERROR(message);
    return result;
}

}  // namespace

ImageStore::ImageStore(std::shared_ptr<const Interface::IConfiguration> config)
    : config_(config ? std::move(config)
                     : std::shared_ptr<const Interface::IConfiguration>(
                           Interface::createDefaultConfiguration())) {
}

ImageStore::LoadResult ImageStore::decode(const std::vector<uchar>& bytes) const {
    if (bytes.empty()) {
        return makeError<LoadResult>(Types::ErrorKind::InvalidImage, "Image data is empty");
    }
    if (bytes.size() > config_->getMaxContentLength()) {
        return makeError<LoadResult>(
            Types::ErrorKind::InvalidImage,
            "Image data exceeds " + std::to_string(config_->getMaxContentLength()) + " bytes");
    }

    try {
        LoadResult result;
        result.image = cv::imdecode(bytes, cv::IMREAD_COLOR);
        if (result.image.empty()) {
            return makeError<LoadResult>(Types::ErrorKind::InvalidImage, "Cannot decode image data");
        }

        result.success = true;
        LOG_DEBUG("Decoded ", result.image.cols, "x", result.image.rows, " image from ",
                  bytes.size(), " bytes");
        return result;

    } catch (const cv::Exception& e) {
        return makeError<LoadResult>(Types::ErrorKind::InvalidImage,
                                     "Error decoding image: " + std::string(e.what()));
    }
}

ImageStore::LoadResult ImageStore::load(const std::string& path) const {
    std::string extension = fs::path(path).extension().string();
    if (!config_->isExtensionAllowed(extension)) {
        return makeError<LoadResult>(Types::ErrorKind::InvalidImage,
                                     "File type not allowed: " + path);
    }

    try {
        LoadResult result;
        result.image = cv::imread(path, cv::IMREAD_COLOR);
        if (result.image.empty()) {
            return makeError<LoadResult>(Types::ErrorKind::InvalidImage,
                                         "Could not read image at " + path);
        }

        result.success = true;
        LOG_DEBUG("Loaded ", result.image.cols, "x", result.image.rows, " image from ", path);
        return result;

    } catch (const cv::Exception& e) {
        return makeError<LoadResult>(Types::ErrorKind::InvalidImage,
                                     "Error reading " + path + ": " + e.what());
    }
}

ImageStore::SaveResult ImageStore::saveUpload(const std::vector<uchar>& bytes) const {
    LoadResult decoded = decode(bytes);
    if (!decoded.success) {
        SaveResult result;
        result.error = decoded.error;
        result.errorMessage = decoded.errorMessage;
        return result;
    }

    return write(decoded.image, makeUploadFilename());
}

ImageStore::SaveResult ImageStore::saveModified(const Types::Image& image, const std::string& sourcePath,
                                                Types::ToneBand tone) const {
    if (image.empty()) {
        return makeError<SaveResult>(Types::ErrorKind::InvalidImage, "Cannot save an empty image");
    }
    return write(image, makeModifiedFilename(sourcePath, tone));
}

ImageStore::SaveResult ImageStore::write(const Types::Image& image, const std::string& filename) const {
    std::string errorMessage;
    if (!ensureUploadFolder(errorMessage)) {
        return makeError<SaveResult>(Types::ErrorKind::StorageFailure, errorMessage);
    }

    std::string path = (fs::path(config_->getUploadFolder()) / filename).string();

    try {
        if (!cv::imwrite(path, image)) {
            return makeError<SaveResult>(Types::ErrorKind::StorageFailure, "Failed to write " + path);
        }
    } catch (const cv::Exception& e) {
        return makeError<SaveResult>(Types::ErrorKind::StorageFailure,
                                     "Error writing " + path + ": " + e.what());
    }

    LOG_INFO("Image saved to ", path);

    SaveResult result;
    result.path = path;
    result.success = true;
    return result;
}

bool ImageStore::ensureUploadFolder(std::string& errorMessage) const {
    std::error_code ec;
    fs::create_directories(config_->getUploadFolder(), ec);
    if (ec) {
        errorMessage = "Cannot create upload folder " + config_->getUploadFolder() + ": " + ec.message();
        return false;
    }
    return true;
}

std::string ImageStore::makeUploadFilename() {
    return "upload_" + timestamp() + "_" + randomHexId(8) + ".jpg";
}

std::string ImageStore::makeModifiedFilename(const std::string& sourcePath, Types::ToneBand tone) {
    fs::path source(sourcePath);
    std::string extension = source.extension().string();
    if (extension.empty()) extension = ".jpg";

    return source.stem().string() + "_" + Types::toString(tone) + "_" + timestamp() + extension;
}

std::string ImageStore::timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string ImageStore::randomHexId(int length) {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    static const char* hexDigits = "0123456789abcdef";
    std::string id;
    for (int i = 0; i < length; ++i) id.push_back(hexDigits[digit(generator)]);
    return id;
}

}  // namespace SkinTone::Internal::Storage
