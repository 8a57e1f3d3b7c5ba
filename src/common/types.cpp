#include "upload_guard/common/types.hpp"

namespace upload_guard {
namespace common {

std::string to_string(ScanVerdict verdict) {
    switch (verdict) {
        case ScanVerdict::CLEAN: return "CLEAN";
        case ScanVerdict::INFECTED: return "INFECTED";
        case ScanVerdict::UNAVAILABLE: return "UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

std::string to_string(UnavailableReason reason) {
    switch (reason) {
        case UnavailableReason::DISABLED: return "DISABLED";
        case UnavailableReason::TIMEOUT: return "TIMEOUT";
        case UnavailableReason::ERROR: return "ERROR";
        case UnavailableReason::NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

}}
