#include "upload_guard/validate/file_validator.hpp"
#include "upload_guard/detect/consistency_matrix.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/hash.hpp"
#include "upload_guard/common/logger.hpp"
#include <fmt/format.h>

namespace upload_guard {
namespace validate {

using core::ValidationErrorCode;

std::string formatMegabytes(uint64_t bytes) {
    return fmt::format("{:.1f}", static_cast<double>(bytes) / (1024.0 * 1024.0));
}

FileValidator::FileValidator(common::ValidatorConfig config,
                             std::unique_ptr<scan::MalwareScanner> scanner)
    : config_(std::move(config)),
      scanner_(std::move(scanner)),
      sniffer_(config_.magic_database),
      polyglot_(sniffer_, constants::limits::POLYGLOT_WINDOW_SIZE),
      patterns_(constants::limits::PATTERN_MATCH_WINDOW) {
    common::Logger::instance().debug("[Validator] Ready | profile={} | max_file_size={} | extensions={} | mime_types={} | scanner={}",
                                    config_.profile, config_.max_file_size,
                                    config_.allowed_extensions.size(), config_.allowed_mime_types.size(),
                                    scanner_ ? scanner_->name() : "none");
}

ValidationResult FileValidator::validate(const std::string& filename,
                                         const std::string& content,
                                         const std::optional<std::string>& claimed_content_type) const {
    return validate(filename, reinterpret_cast<const uint8_t*>(content.data()), content.size(),
                    claimed_content_type);
}

ValidationResult FileValidator::validate(const std::string& filename,
                                         const uint8_t* data, size_t size,
                                         const std::optional<std::string>& claimed_content_type) const {
    try {
        return run(filename, data, size, claimed_content_type);
    } catch (const std::exception& e) {
        common::Logger::instance().error("[Validator] Unexpected fault | file={} | error={}", filename, e.what());
        ValidationResult result;
        result.file_size = size;
        return reject(std::move(result), ValidationErrorCode::DETECTION_FAILED,
                      std::string("Failed to detect file type: ") + e.what());
    }
}

ValidationResult FileValidator::reject(ValidationResult result, ValidationErrorCode code,
                                       std::string message) const {
    common::Logger::instance().warn("[Validator] Rejected | code={} | reason={}",
                                   core::ValidationErrorCodeHelper::toString(code), message);
    result.is_valid = false;
    result.error_code = code;
    result.error_message = std::move(message);
    return result;
}

ValidationResult FileValidator::run(const std::string& filename, const uint8_t* data, size_t size,
                                    const std::optional<std::string>& claimed_content_type) const {
    ValidationResult result;
    result.file_size = size;

    auto extension = detect::extractExtension(filename);
    if (!extension) {
        return reject(std::move(result), ValidationErrorCode::EXTENSION_MISSING,
                      core::ValidationErrorCodeHelper::getMessage(ValidationErrorCode::EXTENSION_MISSING));
    }
    if (config_.allowed_extensions.count(*extension) == 0) {
        return reject(std::move(result), ValidationErrorCode::EXTENSION_NOT_ALLOWED,
                      fmt::format("File extension '.{}' not allowed", *extension));
    }

    if (size == 0) {
        return reject(std::move(result), ValidationErrorCode::FILE_EMPTY,
                      core::ValidationErrorCodeHelper::getMessage(ValidationErrorCode::FILE_EMPTY));
    }
    if (size > config_.max_file_size) {
        return reject(std::move(result), ValidationErrorCode::FILE_TOO_LARGE,
                      fmt::format("File exceeds maximum size of {}MB", formatMegabytes(config_.max_file_size)));
    }

    auto hash = common::sha256Hex(data, size);
    if (!hash) {
        return reject(std::move(result), ValidationErrorCode::HASH_FAILED,
                      core::ValidationErrorCodeHelper::getMessage(ValidationErrorCode::HASH_FAILED));
    }
    result.content_hash = *hash;

    auto sniffed = sniffer_.sniff(data, size);
    if (!sniffed.ok()) {
        return reject(std::move(result), ValidationErrorCode::DETECTION_FAILED,
                      "Failed to detect file type: " + sniffed.message);
    }
    result.detected_mime = *sniffed.value;

    if (config_.allowed_mime_types.count(result.detected_mime) == 0) {
        return reject(std::move(result), ValidationErrorCode::MIME_NOT_ALLOWED,
                      fmt::format("File type '{}' not allowed", result.detected_mime));
    }

    auto polyglot = polyglot_.check(data, size, result.detected_mime);
    if (polyglot) {
        return reject(std::move(result), ValidationErrorCode::POLYGLOT_DETECTED,
                      fmt::format("Polyglot file detected: MIME type changed from {} to {} at offset {}",
                                  polyglot->expected_mime, polyglot->found_mime, polyglot->offset));
    }

    std::optional<std::string> claimed;
    if (claimed_content_type) {
        claimed = detect::normalizeContentType(*claimed_content_type);
    }
    if (claimed && !detect::compatible(*claimed, result.detected_mime)) {
        common::Logger::instance().warn("[Validator] Content-Type mismatch | claimed={} | detected={}",
                                       *claimed, result.detected_mime);
        result.warnings.push_back(fmt::format("Content-Type mismatch: claimed '{}' but detected '{}'",
                                              *claimed, result.detected_mime));
    }

    if (!detect::extensionMatches(*extension, result.detected_mime)) {
        result.warnings.push_back(fmt::format("Extension '.{}' does not match detected type '{}'",
                                              *extension, result.detected_mime));
    }

    auto matches = patterns_.scan(data, size);
    if (!matches.empty()) {
        result.warnings.push_back("File contains suspicious patterns (embedded scripts): " +
                                  detect::joinPatternNames(matches));
    }

    if (scanner_) {
        auto outcome = scanner_->scan(data, size);
        result.malware_scan_result = outcome.annotation();
        common::Logger::instance().debug("[Validator] Scan finished | scanner={} | verdict={}",
                                        scanner_->name(), common::to_string(outcome.verdict));

        switch (outcome.verdict) {
            case common::ScanVerdict::INFECTED:
                return reject(std::move(result), ValidationErrorCode::MALWARE_DETECTED,
                              "Malware detected: " + outcome.signature);
            case common::ScanVerdict::UNAVAILABLE:
                common::Logger::instance().warn("[Validator] Scan unavailable | reason={} | detail={}",
                                               common::to_string(outcome.reason), outcome.detail);
                result.warnings.push_back(fmt::format("Malware scan unavailable: {} ({})",
                                                      outcome.annotation(), outcome.detail));
                break;
            case common::ScanVerdict::CLEAN:
                break;
        }
    }

    result.is_valid = true;
    common::Logger::instance().info("[Validator] Accepted | file={} | mime={} | size={} | hash={} | warnings={}",
                                   filename, result.detected_mime, result.file_size,
                                   common::hashPrefix(result.content_hash), result.warnings.size());
    return result;
}

}}
