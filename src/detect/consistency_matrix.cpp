#include "upload_guard/detect/consistency_matrix.hpp"
#include "upload_guard/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace upload_guard {
namespace detect {

namespace {

bool startsWith(const std::string& value, const char* prefix) {
    std::string p(prefix);
    return value.size() >= p.size() && value.compare(0, p.size(), p) == 0;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}

std::string mimeCategory(const std::string& mime) {
    auto slash = mime.find('/');
    return slash == std::string::npos ? mime : mime.substr(0, slash);
}

bool compatible(const std::string& mime_a, const std::string& mime_b) {
    if (mime_a == mime_b) {
        return true;
    }

    if (mimeCategory(mime_a) == mimeCategory(mime_b)) {
        return true;
    }

    for (const auto& [first, second] : constants::mime::COMPATIBLE_PAIRS) {
        if ((startsWith(mime_a, first) && startsWith(mime_b, second)) ||
            (startsWith(mime_a, second) && startsWith(mime_b, first))) {
            return true;
        }
    }

    return false;
}

std::vector<std::string> expectedMimeTypes(const std::string& extension) {
    std::string ext = toLower(extension);
    std::vector<std::string> result;
    for (const auto& entry : constants::extensions::MIME_MAP) {
        if (ext == entry.extension) {
            result.emplace_back(entry.mime_type);
        }
    }
    return result;
}

bool extensionMatches(const std::string& extension, const std::string& detected_mime) {
    auto expected = expectedMimeTypes(extension);
    if (expected.empty()) {
        return true;
    }
    return std::any_of(expected.begin(), expected.end(),
                       [&](const std::string& mime) { return compatible(mime, detected_mime); });
}

std::optional<std::string> extractExtension(const std::string& filename) {
    auto sep = filename.find_last_of("/\\");
    std::string base = sep == std::string::npos ? filename : filename.substr(sep + 1);

    auto dot = base.rfind('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }
    return toLower(base.substr(dot + 1));
}

std::optional<std::string> normalizeContentType(const std::string& raw) {
    std::string value = raw.substr(0, raw.find(';'));

    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;

    if (begin == end) {
        return std::nullopt;
    }
    return toLower(value.substr(begin, end - begin));
}

}}
