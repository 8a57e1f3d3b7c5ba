#pragma once

#include <string>
#include <vector>
#include <optional>

namespace upload_guard {
namespace detect {

std::string mimeCategory(const std::string& mime);

// Identical types, same top-level category, or a listed cross-category pair
// (prefix match, either order). Everything else is incompatible.
bool compatible(const std::string& mime_a, const std::string& mime_b);

std::vector<std::string> expectedMimeTypes(const std::string& extension);
bool extensionMatches(const std::string& extension, const std::string& detected_mime);

// Lower-cased text after the last dot of the final path component, or nullopt
// when the name has no dot.
std::optional<std::string> extractExtension(const std::string& filename);

// Drops parameters, trims and lower-cases. Empty input yields nullopt.
std::optional<std::string> normalizeContentType(const std::string& raw);

}}
