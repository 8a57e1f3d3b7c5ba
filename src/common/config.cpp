#include "upload_guard/common/config.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/paths.hpp"
#include "upload_guard/common/logger.hpp"
#include <toml.hpp>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unistd.h>

namespace upload_guard {
namespace common {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(begin, end - begin);
}

std::set<std::string> normalizeList(const std::vector<std::string>& values, bool strip_dot) {
    std::set<std::string> out;
    for (const auto& raw : values) {
        std::string v = lower(trim(raw));
        if (strip_dot && !v.empty() && v.front() == '.') {
            v.erase(0, 1);
        }
        out.insert(v);
    }
    return out;
}

}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

std::optional<bool> parseBool(const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return std::nullopt;
}

Config::Config() {
    global_ = createDefaultConfig();
}

ValidatorConfig Config::createProfile(const std::string& profile) {
    ValidatorConfig config;
    config.profile = profile;
    config.magic_database = "";

    if (profile == constants::profiles::IMAGE) {
        config.max_file_size = constants::limits::IMAGE_MAX_FILE_SIZE;
        auto extensions = constants::toVector(constants::profiles::IMAGE_EXTENSIONS);
        auto mime_types = constants::toVector(constants::profiles::IMAGE_MIME_TYPES);
        config.allowed_extensions.insert(extensions.begin(), extensions.end());
        config.allowed_mime_types.insert(mime_types.begin(), mime_types.end());
    } else {
        config.profile = constants::profiles::DEFAULT;
        config.max_file_size = constants::limits::DEFAULT_MAX_FILE_SIZE;
        auto extensions = constants::toVector(constants::extensions::ALLOWED);
        auto mime_types = constants::toVector(constants::mime::ALLOWED);
        config.allowed_extensions.insert(extensions.begin(), extensions.end());
        config.allowed_mime_types.insert(mime_types.begin(), mime_types.end());
    }

    config.scanner.enabled = false;
    config.scanner.command = constants::scanner_defaults::COMMAND;
    config.scanner.arguments = constants::scanner_defaults::getArguments();
    config.scanner.scan_timeout_seconds = constants::limits::DEFAULT_SCAN_TIMEOUT_SECONDS;
    config.scanner.version_check_timeout_seconds = constants::limits::DEFAULT_VERSION_CHECK_TIMEOUT_SECONDS;
    config.scanner.temp_dir = "";

    return config;
}

GlobalConfig Config::createDefaultConfig() {
    GlobalConfig config;

    config.log_level = LogLevel::WARN;
    config.log_file = "";

    config.logging.rotation_size_mb = constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    config.logging.max_files = constants::limits::DEFAULT_LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.validator = createProfile(constants::profiles::DEFAULT);

    return config;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    loaded_from_file_ = false;
    last_error_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (best) {
            effective_config_file = *best;
        }
    } else if (!std::filesystem::exists(effective_config_file)) {
        last_error_ = "configuration file not found: " + effective_config_file;
        Logger::instance().error("[Config] Not found | path={}", effective_config_file);
        return false;
    }

    current_config_path_ = effective_config_file;

    if (!effective_config_file.empty()) {
        if (!tryLoadTomlFile(effective_config_file)) {
            return false;
        }
        loaded_from_file_ = true;
    }

    applyEnvironment();

    Logger::instance().info("[Config] Loaded | path={} | profile={} | max_file_size={} | scan_enabled={}",
                           current_config_path_.empty() ? "<defaults>" : current_config_path_,
                           global_.validator.profile, global_.validator.max_file_size,
                           global_.validator.scanner.enabled);
    return true;
}

bool Config::loadFromString(const std::string& toml_text) {
    global_ = createDefaultConfig();
    last_error_.clear();

    try {
        std::istringstream stream(toml_text);
        auto data = toml::parse(stream, "<inline>");
        applyToml(data);
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        Logger::instance().error("[Config] Parse failed | source=<inline> | error={}", e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        last_error_ = "configuration file not readable: " + path;
        Logger::instance().error("[Config] Not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);
        applyToml(data);
        Logger::instance().debug("[Config] File loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        last_error_ = e.what();
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

template<typename TomlValue>
void Config::applyToml(const TomlValue& data) {
    if (data.contains("global")) {
        const auto& global_section = data.at("global");

        if (global_section.contains("log_file")) {
            global_.log_file = toml::find<std::string>(global_section, "log_file");
        }
        if (global_section.contains("log_level")) {
            std::string level = toml::find<std::string>(global_section, "log_level");
            auto parsed = parseLogLevel(level);
            if (parsed) {
                global_.log_level = *parsed;
            } else {
                throw std::runtime_error("invalid log_level: " + level);
            }
        }
    }

    if (data.contains("logging")) {
        const auto& logging_section = data.at("logging");

        if (logging_section.contains("rotation_size_mb")) {
            global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            global_.logging.format = lower(format_str) == "json" ? LogFormat::JSON : LogFormat::TEXT;
        }
    }

    if (data.contains("validator")) {
        const auto& validator_section = data.at("validator");

        if (validator_section.contains("profile")) {
            std::string profile = lower(toml::find<std::string>(validator_section, "profile"));
            if (!applyProfile(profile)) {
                throw std::runtime_error("unknown validator profile: " + profile);
            }
        }
        if (validator_section.contains("max_file_size")) {
            auto size = toml::find<int64_t>(validator_section, "max_file_size");
            global_.validator.max_file_size = size > 0 ? static_cast<uint64_t>(size) : 0;
        }
        if (validator_section.contains("max_file_size_mb")) {
            auto size_mb = toml::find<int64_t>(validator_section, "max_file_size_mb");
            global_.validator.max_file_size = size_mb > 0 ? static_cast<uint64_t>(size_mb) * 1024 * 1024 : 0;
        }
        if (validator_section.contains("allowed_extensions")) {
            global_.validator.allowed_extensions = normalizeList(
                toml::find<std::vector<std::string>>(validator_section, "allowed_extensions"), true);
        }
        if (validator_section.contains("allowed_mime_types")) {
            global_.validator.allowed_mime_types = normalizeList(
                toml::find<std::vector<std::string>>(validator_section, "allowed_mime_types"), false);
        }
        if (validator_section.contains("magic_database")) {
            global_.validator.magic_database = toml::find<std::string>(validator_section, "magic_database");
        }
    }

    if (data.contains("malware_scan")) {
        const auto& scan_section = data.at("malware_scan");
        auto& scanner = global_.validator.scanner;

        if (scan_section.contains("enabled")) {
            scanner.enabled = toml::find<bool>(scan_section, "enabled");
        }
        if (scan_section.contains("command")) {
            scanner.command = toml::find<std::string>(scan_section, "command");
        }
        if (scan_section.contains("arguments")) {
            scanner.arguments = toml::find<std::vector<std::string>>(scan_section, "arguments");
        }
        if (scan_section.contains("scan_timeout_seconds")) {
            scanner.scan_timeout_seconds = toml::find<int>(scan_section, "scan_timeout_seconds");
        }
        if (scan_section.contains("version_check_timeout_seconds")) {
            scanner.version_check_timeout_seconds = toml::find<int>(scan_section, "version_check_timeout_seconds");
        }
        if (scan_section.contains("temp_dir")) {
            scanner.temp_dir = toml::find<std::string>(scan_section, "temp_dir");
        }
    }
}

void Config::applyEnvironment() {
    if (const char* scan_env = std::getenv(constants::env::ENABLE_MALWARE_SCAN)) {
        auto enabled = parseBool(scan_env);
        if (enabled) {
            global_.validator.scanner.enabled = *enabled;
        } else {
            Logger::instance().warn("[Config] Ignoring invalid environment value | name={} | value={}",
                                   constants::env::ENABLE_MALWARE_SCAN, scan_env);
        }
    }

    if (const char* size_env = std::getenv(constants::env::MAX_FILE_SIZE)) {
        try {
            size_t consumed = 0;
            std::string value = trim(size_env);
            // stoull accepts a sign and wraps negative input around to huge values.
            if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
                throw std::invalid_argument("not an unsigned number");
            }
            unsigned long long bytes = std::stoull(value, &consumed);
            if (consumed != value.size() || bytes == 0) {
                throw std::invalid_argument("trailing characters or zero");
            }
            global_.validator.max_file_size = bytes;
        } catch (const std::exception&) {
            Logger::instance().warn("[Config] Ignoring invalid environment value | name={} | value={}",
                                   constants::env::MAX_FILE_SIZE, size_env);
        }
    }
}

bool Config::applyProfile(const std::string& profile) {
    if (!constants::profiles::isKnown(profile)) {
        last_error_ = "unknown validator profile: " + profile;
        return false;
    }

    ValidatorConfig base = createProfile(profile);
    global_.validator.profile = base.profile;
    global_.validator.max_file_size = base.max_file_size;
    global_.validator.allowed_extensions = base.allowed_extensions;
    global_.validator.allowed_mime_types = base.allowed_mime_types;
    return true;
}

bool Config::setMaxFileSize(uint64_t bytes) {
    if (bytes == 0) {
        return false;
    }
    global_.validator.max_file_size = bytes;
    return true;
}

void Config::setScanEnabled(bool enabled) {
    global_.validator.scanner.enabled = enabled;
}

std::string Config::dump() const {
    const auto& validator = global_.validator;

    toml::value data = toml::table{
        {"global", toml::table{
            {"log_file", global_.log_file},
            {"log_level", to_string(global_.log_level)}
        }},
        {"logging", toml::table{
            {"rotation_size_mb", global_.logging.rotation_size_mb},
            {"max_files", global_.logging.max_files},
            {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
        }},
        {"validator", toml::table{
            {"profile", validator.profile},
            {"max_file_size", validator.max_file_size},
            {"allowed_extensions", std::vector<std::string>(validator.allowed_extensions.begin(),
                                                             validator.allowed_extensions.end())},
            {"allowed_mime_types", std::vector<std::string>(validator.allowed_mime_types.begin(),
                                                             validator.allowed_mime_types.end())},
            {"magic_database", validator.magic_database}
        }},
        {"malware_scan", toml::table{
            {"enabled", validator.scanner.enabled},
            {"command", validator.scanner.command},
            {"arguments", validator.scanner.arguments},
            {"scan_timeout_seconds", validator.scanner.scan_timeout_seconds},
            {"version_check_timeout_seconds", validator.scanner.version_check_timeout_seconds},
            {"temp_dir", validator.scanner.temp_dir}
        }}
    };

    return toml::format(data);
}

}}
