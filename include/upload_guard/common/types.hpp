#pragma once

#include <string>

namespace upload_guard {
namespace common {

enum class ScanVerdict {
    CLEAN,
    INFECTED,
    UNAVAILABLE
};

enum class UnavailableReason {
    DISABLED,
    TIMEOUT,
    ERROR,
    NOT_FOUND
};

std::string to_string(ScanVerdict verdict);
std::string to_string(UnavailableReason reason);

}}
