#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace SkinTone::Shared {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

class Logger {
  public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        currentLevel_ = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentLevel_;
    }

    // Accepts DEBUG/INFO/WARN/WARNING/ERROR, any case. Returns false and keeps the
    // current level on anything else.
    bool setLevel(const std::string& name) {
        std::string upper;
        for (char c : name) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

        if (upper == "DEBUG") {
            setLevel(LogLevel::DEBUG);
        } else if (upper == "INFO") {
            setLevel(LogLevel::INFO);
        } else if (upper == "WARN" || upper == "WARNING") {
            setLevel(LogLevel::WARN);
        } else if (upper == "ERROR") {
            setLevel(LogLevel::ERROR);
        } else {
            return false;
        }
        return true;
    }

    template <typename... Args>
    void debug(Args&&... args) {
        log(LogLevel::DEBUG, "DEBUG", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, "INFO", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(LogLevel::WARN, "WARNING", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, "ERROR", std::forward<Args>(args)...);
    }

  private:
    mutable std::mutex mutex_;
    LogLevel currentLevel_ = LogLevel::INFO;

    template <typename... Args>
    void log(LogLevel level, const std::string& levelStr, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < currentLevel_) return;

        std::ostringstream oss;
        oss << timestamp() << " - " << levelStr << " - ";
        ((oss << std::forward<Args>(args)), ...);

        // Warnings and errors go to stderr so CLI output stays clean
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << oss.str() << std::endl;
    }

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setfill('0') << std::setw(3)
            << ms.count();
        return oss.str();
    }

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(...) SkinTone::Shared::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) SkinTone::Shared::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) SkinTone::Shared::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) SkinTone::Shared::Logger::getInstance().error(__VA_ARGS__)

}  // namespace SkinTone::Shared
