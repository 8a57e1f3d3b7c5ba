#include "upload_guard/detect/pattern_scanner.hpp"
#include "upload_guard/common/logger.hpp"
#include <algorithm>
#include <cctype>

namespace upload_guard {
namespace detect {

namespace {

const auto kRegexFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

bool equalsIgnoreCase(uint8_t a, char b) {
    return std::tolower(a) == std::tolower(static_cast<unsigned char>(b));
}

}

PatternScanner::PatternScanner(size_t confirm_window) : confirm_window_(confirm_window) {
    patterns_.push_back({"script_tag", "<script", std::regex(R"(^<script[^>]{0,256}>)", kRegexFlags)});
    patterns_.push_back({"javascript_uri", "javascript:", std::nullopt});
    patterns_.push_back({"vbscript_uri", "vbscript:", std::nullopt});
    patterns_.push_back({"onerror_handler", "onerror", std::regex(R"(^onerror\s{0,16}=)", kRegexFlags)});
    patterns_.push_back({"onload_handler", "onload", std::regex(R"(^onload\s{0,16}=)", kRegexFlags)});
    patterns_.push_back({"onmouseover_handler", "onmouseover", std::regex(R"(^onmouseover\s{0,16}=)", kRegexFlags)});
    patterns_.push_back({"iframe_tag", "<iframe", std::regex(R"(^<iframe[^>]{0,256}>)", kRegexFlags)});
    patterns_.push_back({"eval_call", "eval", std::regex(R"(^eval\s{0,16}\()", kRegexFlags)});
    patterns_.push_back({"document_cookie", "document.cookie", std::nullopt});
    patterns_.push_back({"document_write", "document.write", std::nullopt});
}

std::vector<std::string> PatternScanner::patternNames() const {
    std::vector<std::string> names;
    for (const auto& pattern : patterns_) {
        names.push_back(pattern.name);
    }
    return names;
}

std::optional<size_t> PatternScanner::firstMatch(const Pattern& pattern, const uint8_t* data, size_t size) const {
    const uint8_t* end = data + size;
    const uint8_t* cursor = data;

    while (cursor < end) {
        const uint8_t* hit = std::search(cursor, end, pattern.anchor.begin(), pattern.anchor.end(),
                                         equalsIgnoreCase);
        if (hit == end) {
            return std::nullopt;
        }

        if (!pattern.confirm) {
            return static_cast<size_t>(hit - data);
        }

        size_t available = static_cast<size_t>(end - hit);
        size_t window = std::min(confirm_window_, available);
        const char* first = reinterpret_cast<const char*>(hit);
        if (std::regex_search(first, first + window, *pattern.confirm,
                              std::regex_constants::match_continuous)) {
            return static_cast<size_t>(hit - data);
        }

        cursor = hit + 1;
    }

    return std::nullopt;
}

std::vector<PatternMatch> PatternScanner::scan(const uint8_t* data, size_t size) const {
    std::vector<PatternMatch> matches;
    if (size == 0) {
        return matches;
    }

    for (const auto& pattern : patterns_) {
        auto offset = firstMatch(pattern, data, size);
        if (offset) {
            common::Logger::instance().warn("[PatternScanner] Suspicious pattern | pattern={} | offset={}",
                                           pattern.name, *offset);
            matches.push_back({pattern.name, *offset});
        }
    }

    return matches;
}

std::string joinPatternNames(const std::vector<PatternMatch>& matches) {
    std::string joined;
    for (const auto& match : matches) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += match.name;
    }
    return joined;
}

}}
