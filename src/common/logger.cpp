#include "upload_guard/common/logger.hpp"
#include "upload_guard/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace upload_guard {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN =
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","logger":"%n","thread":%t,"msg":"%v"})";

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::warn;
}

}

std::string jsonLogPath(const std::string& log_file) {
    std::filesystem::path path(log_file);
    std::filesystem::path renamed = path.stem();
    renamed += ".json";
    renamed += path.extension();
    return (path.parent_path() / renamed).string();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const GlobalConfig& config) {
    initialize(config.log_file.empty() ? LogMode::CONSOLE_ONLY : LogMode::FILE_ONLY,
               config.log_file, config.log_level, config.logging);
}

spdlog::sink_ptr Logger::openFileSink(const std::string& log_file, const LoggingConfig& logging_config) {
    std::filesystem::path dir = std::filesystem::path(log_file).parent_path();

    std::error_code ec;
    if (!dir.empty() && !std::filesystem::exists(dir, ec) && !std::filesystem::create_directories(dir, ec)) {
        std::cerr << "[Logger] Cannot create log directory " << dir << ": " << ec.message()
                  << ", logging to stderr" << std::endl;
        return nullptr;
    }

    std::string target = logging_config.format == LogFormat::JSON ? jsonLogPath(log_file) : log_file;
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            target, logging_config.rotation_size_mb * 1024 * 1024, logging_config.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open " << target << ": " << ex.what()
                  << ", logging to stderr" << std::endl;
        return nullptr;
    }
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (logger_) {
        logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        return;
    }

    spdlog::sink_ptr sink;
    bool to_file = false;
    if (mode == LogMode::FILE_ONLY && !log_file.empty()) {
        sink = openFileSink(log_file, logging_config);
        to_file = sink != nullptr;
    }
    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }

    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(logging_config.format == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(toSpdlogLevel(level));
    if (to_file) {
        logger_->flush_on(spdlog::level::warn);
    }

    spdlog::drop(constants::system::LOGGER_NAME);
    spdlog::register_logger(logger_);
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

}}
