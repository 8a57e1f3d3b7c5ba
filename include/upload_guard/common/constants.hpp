#pragma once

#include <string>
#include <vector>
#include <array>
#include <utility>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("upload-guard v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "upload-guard";
    constexpr const char* LOGGER_NAME = "upload-guard";
    constexpr const char* CONFIG_FILE_NAME = "upload-guard.toml";
    constexpr const char* SYSTEM_CONFIG_FILE = "/etc/upload-guard/upload-guard.toml";
    constexpr const char* TEMP_FILE_PREFIX = "upload-guard-";
}

namespace env {
    constexpr const char* ENABLE_MALWARE_SCAN = "ENABLE_MALWARE_SCAN";
    constexpr const char* MAX_FILE_SIZE = "UPLOAD_GUARD_MAX_FILE_SIZE";
    constexpr const char* CONFIG_PATH = "UPLOAD_GUARD_CONFIG";
}

namespace mime {
    constexpr const char* GENERIC = "application/octet-stream";
    constexpr const char* PLAIN_TEXT = "text/plain";

    // libmagic names WAVE audio audio/x-wav; both spellings are accepted.
    constexpr std::array<const char*, 17> ALLOWED = {
        "image/jpeg", "image/png", "image/gif", "image/webp", "image/heic", "image/heif",
        "application/pdf",
        "application/msword",
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
        "text/plain",
        "video/mp4", "video/webm", "video/quicktime",
        "audio/mpeg", "audio/wav", "audio/x-wav", "audio/ogg"
    };

    // Cross-category pairs tolerated by the consistency matrix, matched by prefix
    // in either order. Adding a pair widens what the polyglot check lets through.
    constexpr std::array<std::pair<const char*, const char*>, 4> COMPATIBLE_PAIRS = {{
        {"application/zip", "application/vnd.openxmlformats"},
        {"application/zip", "text/xml"},
        {"application/vnd.openxmlformats", "text/xml"},
        {"text/plain", "text/html"}
    }};
}

namespace polyglot {
    // Starts of active content searched for around each polyglot checkpoint.
    // Markup tokens are matched case-insensitively; XML prologues are left out
    // because XMP metadata embeds them in ordinary images and PDFs.
    constexpr std::array<const char*, 6> MARKUP_TOKENS = {
        "<!doctype html", "<html", "<head", "<body", "<script", "<iframe"
    };

    constexpr std::array<const char*, 3> MAGIC_PREFIXES = {
        "\x7f" "ELF", "PK\x03\x04", "%PDF-"
    };
}

namespace extensions {
    constexpr std::array<const char*, 17> ALLOWED = {
        "jpg", "jpeg", "png", "gif", "webp", "heic", "heif",
        "pdf", "doc", "docx", "txt",
        "mp4", "webm", "mov",
        "mp3", "wav", "ogg"
    };

    struct ExtensionMime {
        const char* extension;
        const char* mime_type;
    };

    constexpr std::array<ExtensionMime, 20> MIME_MAP = {{
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png", "image/png"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"heic", "image/heic"},
        {"heif", "image/heif"},
        {"pdf", "application/pdf"},
        {"doc", "application/msword"},
        {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {"docx", "application/zip"},
        {"txt", "text/plain"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mov", "video/quicktime"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"wav", "audio/x-wav"},
        {"ogg", "audio/ogg"},
        {"ogg", "video/ogg"}
    }};
}

namespace profiles {
    constexpr const char* DEFAULT = "default";
    constexpr const char* IMAGE = "image";

    constexpr std::array<const char*, 7> IMAGE_EXTENSIONS = {
        "jpg", "jpeg", "png", "gif", "webp", "heic", "heif"
    };

    constexpr std::array<const char*, 6> IMAGE_MIME_TYPES = {
        "image/jpeg", "image/png", "image/gif", "image/webp", "image/heic", "image/heif"
    };

    inline bool isKnown(const std::string& name) {
        return name == DEFAULT || name == IMAGE;
    }
}

namespace limits {
    constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 10ULL * 1024 * 1024;
    constexpr uint64_t IMAGE_MAX_FILE_SIZE = 25ULL * 1024 * 1024;
    // Uploads are validated in memory; anything above this is a misconfiguration.
    constexpr uint64_t MAX_FILE_SIZE_CEILING = 4ULL * 1024 * 1024 * 1024;

    constexpr size_t POLYGLOT_WINDOW_SIZE = 2048;
    constexpr size_t PATTERN_MATCH_WINDOW = 512;
    constexpr size_t MAX_PROCESS_OUTPUT = 64 * 1024;

    constexpr int DEFAULT_SCAN_TIMEOUT_SECONDS = 30;
    constexpr int DEFAULT_VERSION_CHECK_TIMEOUT_SECONDS = 5;
    constexpr int MAX_TIMEOUT_SECONDS = 600;
    constexpr int DEFAULT_BATCH_THREADS = 4;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 100;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 5;
}

namespace scanner_defaults {
    constexpr const char* COMMAND = "clamdscan";
    constexpr const char* VERSION_FLAG = "--version";

    inline std::vector<std::string> getArguments() {
        return {"--no-summary"};
    }
}

namespace scan_annotations {
    constexpr const char* CLEAN = "CLEAN";
    constexpr const char* DISABLED = "SCAN_DISABLED";
    constexpr const char* TIMEOUT = "SCAN_TIMEOUT";
    constexpr const char* ERROR = "SCAN_ERROR";
    constexpr const char* UNKNOWN_SIGNATURE = "INFECTED";
}

template<size_t N>
inline std::vector<std::string> toVector(const std::array<const char*, N>& values) {
    return std::vector<std::string>(values.begin(), values.end());
}

}
}
