#pragma once

#include "signature_sniffer.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace detect {

struct PolyglotFinding {
    size_t offset = 0;
    std::string expected_mime;
    std::string found_mime;
};

// Samples the buffer at fixed checkpoints and re-sniffs a window at each one.
// Around every checkpoint, embedded starts of active content
// (HTML, ELF, ZIP, PDF) that would overlap the checkpoint window are sniffed
// too, so a payload cannot dodge detection by sitting a few bytes off a
// checkpoint.
class PolyglotDetector {
public:
    PolyglotDetector(const SignatureSniffer& sniffer, size_t window_size);

    // Offsets 0, 25%, 50%, 75% and size - window (clamped to 0), duplicates removed.
    static std::vector<size_t> checkpoints(size_t size, size_t window_size);

    // Sorted offsets in [begin, end) where an embedded signature starts.
    static std::vector<size_t> embeddedSignatures(const uint8_t* data, size_t size,
                                                  size_t begin, size_t end);

    std::optional<PolyglotFinding> check(const uint8_t* data, size_t size,
                                         const std::string& whole_mime) const;

private:
    const SignatureSniffer& sniffer_;
    size_t window_size_;

    static bool carriesSignature(const std::string& mime);
};

}}
