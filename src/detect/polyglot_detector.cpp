#include "upload_guard/detect/polyglot_detector.hpp"
#include "upload_guard/detect/consistency_matrix.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include <algorithm>
#include <set>
#include <cctype>
#include <cstring>

namespace upload_guard {
namespace detect {

namespace {

void collectMatches(const uint8_t* data, size_t size, size_t begin, size_t end,
                    const char* token, bool fold_case, std::vector<size_t>& out) {
    size_t length = std::strlen(token);
    if (length == 0 || begin >= end || begin >= size) {
        return;
    }

    const uint8_t* needle = reinterpret_cast<const uint8_t*>(token);
    const uint8_t* first = data + begin;
    // A match may start anywhere before end and run past it.
    const uint8_t* last = data + std::min(size, end + length - 1);

    auto equal = [fold_case](uint8_t haystack, uint8_t wanted) {
        if (fold_case) {
            return static_cast<uint8_t>(std::tolower(haystack)) == wanted;
        }
        return haystack == wanted;
    };

    while (first < last) {
        const uint8_t* hit = std::search(first, last, needle, needle + length, equal);
        if (hit == last) {
            break;
        }
        out.push_back(static_cast<size_t>(hit - data));
        first = hit + 1;
    }
}

}

PolyglotDetector::PolyglotDetector(const SignatureSniffer& sniffer, size_t window_size)
    : sniffer_(sniffer), window_size_(window_size) {}

std::vector<size_t> PolyglotDetector::checkpoints(size_t size, size_t window_size) {
    std::vector<size_t> candidates = {
        0,
        size / 4,
        size / 2,
        (size / 4) * 3 + ((size % 4) * 3) / 4,
        size > window_size ? size - window_size : 0
    };

    std::vector<size_t> result;
    for (size_t offset : candidates) {
        if (offset < size && std::find(result.begin(), result.end(), offset) == result.end()) {
            result.push_back(offset);
        }
    }
    return result;
}

std::vector<size_t> PolyglotDetector::embeddedSignatures(const uint8_t* data, size_t size,
                                                         size_t begin, size_t end) {
    std::vector<size_t> offsets;
    end = std::min(end, size);

    for (const char* token : constants::polyglot::MARKUP_TOKENS) {
        collectMatches(data, size, begin, end, token, true, offsets);
    }
    for (const char* magic : constants::polyglot::MAGIC_PREFIXES) {
        collectMatches(data, size, begin, end, magic, false, offsets);
    }

    std::sort(offsets.begin(), offsets.end());
    offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());
    return offsets;
}

bool PolyglotDetector::carriesSignature(const std::string& mime) {
    return mime != constants::mime::GENERIC && mime != constants::mime::PLAIN_TEXT;
}

std::optional<PolyglotFinding> PolyglotDetector::check(const uint8_t* data, size_t size,
                                                       const std::string& whole_mime) const {
    std::set<size_t> examined;

    for (size_t offset : checkpoints(size, window_size_)) {
        size_t length = std::min(window_size_, size - offset);
        auto local = sniffer_.sniff(data + offset, length);

        if (!local.ok()) {
            common::Logger::instance().warn("[Polyglot] Checkpoint skipped | offset={} | error={}",
                                           offset, local.message);
        } else if (offset == 0 || carriesSignature(*local.value)) {
            if (!compatible(whole_mime, *local.value)) {
                common::Logger::instance().warn("[Polyglot] Inconsistent checkpoint | offset={} | expected={} | found={}",
                                               offset, whole_mime, *local.value);
                return PolyglotFinding{offset, whole_mime, *local.value};
            }
            common::Logger::instance().debug("[Polyglot] Checkpoint consistent | offset={} | mime={}",
                                            offset, *local.value);
        }

        // Byte 0 belongs to the whole-file signature; embedded starts never do.
        size_t begin = offset > window_size_ ? offset - window_size_ + 1 : 1;
        for (size_t start : embeddedSignatures(data, size, begin, offset + length)) {
            if (start == offset || !examined.insert(start).second) {
                continue;
            }

            auto embedded = sniffer_.sniff(data + start, std::min(window_size_, size - start));
            if (!embedded.ok() || !carriesSignature(*embedded.value)) {
                continue;
            }
            if (!compatible(whole_mime, *embedded.value)) {
                common::Logger::instance().warn("[Polyglot] Embedded signature | checkpoint={} | offset={} | expected={} | found={}",
                                               offset, start, whole_mime, *embedded.value);
                return PolyglotFinding{start, whole_mime, *embedded.value};
            }
        }
    }

    return std::nullopt;
}

}}
