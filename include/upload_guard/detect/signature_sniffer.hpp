#pragma once

#include "../common/error_framework.hpp"
#include "../core/error_codes.hpp"
#include <string>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace detect {

using SniffOutcome = common::Outcome<std::string, core::ValidationErrorCode>;

// Content-based MIME detection backed by libmagic. No filename input.
// Each thread lazily opens its own magic cookie per database path, so one
// sniffer may be shared by concurrent validations.
class SignatureSniffer {
public:
    explicit SignatureSniffer(std::string magic_database = "");

    SniffOutcome sniff(const uint8_t* data, size_t size) const;
    SniffOutcome sniff(const std::string& data) const;

    bool available() const;

private:
    std::string database_;
};

}}
