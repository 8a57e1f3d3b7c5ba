#include "upload_guard/config/config_validator.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include "upload_guard/detect/consistency_matrix.hpp"
#include <filesystem>
#include <regex>
#include <algorithm>

namespace upload_guard {
namespace config {

ConfigCheckResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ConfigCheckResult result;
    const auto& validator = config.validator;

    common::Logger::instance().debug("[ConfigValidator] Starting validation");

    if (validator.max_file_size == 0) {
        result.errors.push_back("validator.max_file_size: Must be greater than 0");
        result.is_valid = false;
    } else if (validator.max_file_size > constants::limits::MAX_FILE_SIZE_CEILING) {
        result.errors.push_back("validator.max_file_size: Must not exceed " +
                                std::to_string(constants::limits::MAX_FILE_SIZE_CEILING) + " bytes");
        result.is_valid = false;
    }

    if (validator.allowed_extensions.empty()) {
        result.errors.push_back("validator.allowed_extensions: At least one extension is required");
        result.is_valid = false;
    }

    for (const auto& ext : validator.allowed_extensions) {
        if (!validateExtension(ext)) {
            result.errors.push_back("validator.allowed_extensions: Invalid entry '" + ext + "'");
            result.is_valid = false;
        }
    }

    if (validator.allowed_mime_types.empty()) {
        result.errors.push_back("validator.allowed_mime_types: At least one MIME type is required");
        result.is_valid = false;
    }

    for (const auto& mime : validator.allowed_mime_types) {
        if (!validateMimeType(mime)) {
            result.errors.push_back("validator.allowed_mime_types: Invalid entry '" + mime + "'");
            result.is_valid = false;
        }
    }

    for (const auto& ext : validator.allowed_extensions) {
        auto expected = detect::expectedMimeTypes(ext);
        if (expected.empty()) {
            continue;
        }
        bool reachable = std::any_of(expected.begin(), expected.end(), [&](const std::string& mime) {
            return validator.allowed_mime_types.count(mime) > 0;
        });
        if (!reachable) {
            result.warnings.push_back("validator.allowed_extensions: '." + ext +
                                      "' maps only to MIME types outside allowed_mime_types");
        }
    }

    if (!validator.magic_database.empty() && !std::filesystem::exists(validator.magic_database)) {
        result.errors.push_back("validator.magic_database: File does not exist");
        result.is_valid = false;
    }

    const auto& scanner = validator.scanner;
    if (scanner.enabled) {
        if (scanner.command.empty()) {
            result.errors.push_back("malware_scan.command: Required when scanning is enabled");
            result.is_valid = false;
        }
        if (!validateTimeout(scanner.scan_timeout_seconds)) {
            result.errors.push_back("malware_scan.scan_timeout_seconds: Must be between 1-600 seconds");
            result.is_valid = false;
        }
        if (!validateTimeout(scanner.version_check_timeout_seconds)) {
            result.errors.push_back("malware_scan.version_check_timeout_seconds: Must be between 1-600 seconds");
            result.is_valid = false;
        }
        if (!scanner.temp_dir.empty() && !std::filesystem::is_directory(scanner.temp_dir)) {
            result.errors.push_back("malware_scan.temp_dir: Not a directory");
            result.is_valid = false;
        }
    } else {
        result.warnings.push_back("malware_scan.enabled: Scanning disabled, uploads are not checked for malware");
    }

    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("global.log_file: Cannot create parent directory");
        result.is_valid = false;
    }

    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }

    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }

    if (result.is_valid) {
        common::Logger::instance().info("[ConfigValidator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[ConfigValidator] Failed | errors={}", result.errors.size());
    }

    return result;
}

ConfigCheckResult ConfigValidator::validateFile(const std::string& path) {
    ConfigCheckResult result;

    if (!std::filesystem::exists(path)) {
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[ConfigValidator] File not found | path={}", path);
        return result;
    }

    common::Config config;
    if (!config.load(path)) {
        result.errors.push_back("Failed to parse configuration file: " + config.lastError());
        result.is_valid = false;
        return result;
    }

    return validate(config.global());
}

bool ConfigValidator::validateExtension(const std::string& extension) {
    static const std::regex pattern(R"(^[a-z0-9]{1,16}$)");
    return std::regex_match(extension, pattern);
}

bool ConfigValidator::validateMimeType(const std::string& mime) {
    static const std::regex pattern(R"(^[a-z]+/[a-z0-9][a-z0-9.+\-]*$)");
    return std::regex_match(mime, pattern);
}

bool ConfigValidator::validateTimeout(int seconds) {
    return seconds >= 1 && seconds <= constants::limits::MAX_TIMEOUT_SECONDS;
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);

    if (p.empty()) {
        return true;
    }

    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }

    auto parent = p.parent_path();
    if (parent.empty() || parent == p) {
        return true;
    }

    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }

    return canCreateDirectory(parent.string());
}

}}
