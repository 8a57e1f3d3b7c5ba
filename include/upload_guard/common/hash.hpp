#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace common {

// Lower-case hex SHA-256 of the buffer, or nullopt if the digest primitive fails.
std::optional<std::string> sha256Hex(const uint8_t* data, size_t size);
std::optional<std::string> sha256Hex(const std::string& data);

std::string toHex(const uint8_t* data, size_t size);

}}
