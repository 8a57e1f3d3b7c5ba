#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace upload_guard {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

// Process-wide spdlog wrapper. Until initialize() runs every call is a no-op,
// which keeps the library quiet when embedded in a host without logging.
class Logger {
public:
    static Logger& instance();

    void initialize(const GlobalConfig& config);
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }

    void flush();

    bool isInitialized() const { return logger_ != nullptr; }

private:
    Logger() = default;
    std::shared_ptr<spdlog::logger> logger_;

    spdlog::sink_ptr openFileSink(const std::string& log_file, const LoggingConfig& logging_config);
};

std::string jsonLogPath(const std::string& log_file);

inline std::string hashPrefix(const std::string& hash) {
    return hash.size() > 16 ? hash.substr(0, 16) : hash;
}

}}
