#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace upload_guard {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct ScannerConfig {
    bool enabled = false;
    std::string command;
    std::vector<std::string> arguments;
    int scan_timeout_seconds = 0;
    int version_check_timeout_seconds = 0;
    std::string temp_dir;
};

struct ValidatorConfig {
    std::string profile;
    uint64_t max_file_size = 0;
    std::set<std::string> allowed_extensions;
    std::set<std::string> allowed_mime_types;
    std::string magic_database;
    ScannerConfig scanner;
};

struct GlobalConfig {
    LogLevel log_level;
    std::string log_file;
    LoggingConfig logging;
    ValidatorConfig validator;
};

std::optional<LogLevel> parseLogLevel(const std::string& value);
std::string to_string(LogLevel level);

std::optional<bool> parseBool(const std::string& value);

// Loads configuration once at startup. The resulting GlobalConfig is a plain
// value: callers copy what they need and never write back.
class Config {
public:
    Config();

    static GlobalConfig createDefaultConfig();
    static ValidatorConfig createProfile(const std::string& profile);

    bool load(const std::string& config_file = "");
    bool loadFromString(const std::string& toml_text);
    void applyEnvironment();
    bool applyProfile(const std::string& profile);

    const GlobalConfig& global() const { return global_; }

    bool setMaxFileSize(uint64_t bytes);
    void setScanEnabled(bool enabled);
    void setLogLevel(LogLevel level) { global_.log_level = level; }

    std::string dump() const;

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const { return current_config_path_; }
    bool loadedFromFile() const { return loaded_from_file_; }
    const std::string& lastError() const { return last_error_; }

private:
    GlobalConfig global_;
    std::string current_config_path_;
    bool loaded_from_file_ = false;
    std::string last_error_;

    bool tryLoadTomlFile(const std::string& path);
    template<typename TomlValue>
    void applyToml(const TomlValue& data);
};

}}
