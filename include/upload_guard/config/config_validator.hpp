#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace upload_guard {
namespace config {

struct ConfigCheckResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ConfigCheckResult validate(const common::GlobalConfig& config);
    ConfigCheckResult validateFile(const std::string& path);

    static bool validateExtension(const std::string& extension);
    static bool validateMimeType(const std::string& mime);
    static bool validateTimeout(int seconds);
    static bool canCreateDirectory(const std::string& path);
};

}}
