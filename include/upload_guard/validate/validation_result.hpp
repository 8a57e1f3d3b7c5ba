#pragma once

#include "../core/error_codes.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace upload_guard {
namespace validate {

struct ValidationResult {
    bool is_valid = false;
    std::string detected_mime;
    uint64_t file_size = 0;
    std::string content_hash;
    std::optional<std::string> error_message;
    std::optional<core::ValidationErrorCode> error_code;
    std::vector<std::string> warnings;
    std::optional<std::string> malware_scan_result;

    bool operator==(const ValidationResult& other) const {
        return is_valid == other.is_valid &&
               detected_mime == other.detected_mime &&
               file_size == other.file_size &&
               content_hash == other.content_hash &&
               error_message == other.error_message &&
               error_code == other.error_code &&
               warnings == other.warnings &&
               malware_scan_result == other.malware_scan_result;
    }

    bool operator!=(const ValidationResult& other) const { return !(*this == other); }
};

}}
