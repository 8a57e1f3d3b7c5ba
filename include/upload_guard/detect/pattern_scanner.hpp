#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace detect {

struct PatternMatch {
    std::string name;
    size_t offset = 0;
};

// Case-insensitive search for script-injection markers over the whole buffer.
// Each pattern is located by a literal anchor, then optionally confirmed by a
// bounded regex applied to a fixed-size window starting at the anchor.
class PatternScanner {
public:
    explicit PatternScanner(size_t confirm_window);

    std::vector<PatternMatch> scan(const uint8_t* data, size_t size) const;

    std::vector<std::string> patternNames() const;

private:
    struct Pattern {
        std::string name;
        std::string anchor;
        std::optional<std::regex> confirm;
    };

    std::vector<Pattern> patterns_;
    size_t confirm_window_;

    std::optional<size_t> firstMatch(const Pattern& pattern, const uint8_t* data, size_t size) const;
};

std::string joinPatternNames(const std::vector<PatternMatch>& matches);

}}
