#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace upload_guard {
namespace core {

enum class ValidationErrorCode {
    EXTENSION_MISSING = 100,
    EXTENSION_NOT_ALLOWED = 101,

    FILE_EMPTY = 200,
    FILE_TOO_LARGE = 201,

    HASH_FAILED = 300,
    DETECTION_FAILED = 301,

    MIME_NOT_ALLOWED = 400,
    POLYGLOT_DETECTED = 401,

    MALWARE_DETECTED = 500
};

using ValidationErrorCodeHelper = common::ErrorRegistry<ValidationErrorCode>;

}
}

namespace upload_guard {
namespace common {

template<>
inline const std::unordered_map<core::ValidationErrorCode, ErrorInfo<core::ValidationErrorCode>>&
ErrorRegistry<core::ValidationErrorCode>::getInfoMap() {
    static const std::unordered_map<core::ValidationErrorCode, ErrorInfo<core::ValidationErrorCode>> map = {
        {core::ValidationErrorCode::EXTENSION_MISSING, {
            core::ValidationErrorCode::EXTENSION_MISSING,
            "EXTENSION_MISSING",
            "File must have an extension"
        }},
        {core::ValidationErrorCode::EXTENSION_NOT_ALLOWED, {
            core::ValidationErrorCode::EXTENSION_NOT_ALLOWED,
            "EXTENSION_NOT_ALLOWED",
            "File extension not allowed"
        }},
        {core::ValidationErrorCode::FILE_EMPTY, {
            core::ValidationErrorCode::FILE_EMPTY,
            "FILE_EMPTY",
            "File is empty"
        }},
        {core::ValidationErrorCode::FILE_TOO_LARGE, {
            core::ValidationErrorCode::FILE_TOO_LARGE,
            "FILE_TOO_LARGE",
            "File exceeds maximum size"
        }},
        {core::ValidationErrorCode::HASH_FAILED, {
            core::ValidationErrorCode::HASH_FAILED,
            "HASH_FAILED",
            "Failed to compute content hash"
        }},
        {core::ValidationErrorCode::DETECTION_FAILED, {
            core::ValidationErrorCode::DETECTION_FAILED,
            "DETECTION_FAILED",
            "Failed to detect file type"
        }},
        {core::ValidationErrorCode::MIME_NOT_ALLOWED, {
            core::ValidationErrorCode::MIME_NOT_ALLOWED,
            "MIME_NOT_ALLOWED",
            "File type not allowed"
        }},
        {core::ValidationErrorCode::POLYGLOT_DETECTED, {
            core::ValidationErrorCode::POLYGLOT_DETECTED,
            "POLYGLOT_DETECTED",
            "Polyglot file detected"
        }},
        {core::ValidationErrorCode::MALWARE_DETECTED, {
            core::ValidationErrorCode::MALWARE_DETECTED,
            "MALWARE_DETECTED",
            "Malware detected"
        }}
    };
    return map;
}

}
}
