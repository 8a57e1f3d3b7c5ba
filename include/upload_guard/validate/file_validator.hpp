#pragma once

#include "validation_result.hpp"
#include "../common/config.hpp"
#include "../detect/signature_sniffer.hpp"
#include "../detect/polyglot_detector.hpp"
#include "../detect/pattern_scanner.hpp"
#include "../scan/malware_scanner.hpp"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace validate {

// Runs the staged checks on one in-memory upload. Configuration is copied in at
// construction and never changes; validate() may be called from many threads.
class FileValidator {
public:
    explicit FileValidator(common::ValidatorConfig config,
                           std::unique_ptr<scan::MalwareScanner> scanner = nullptr);

    FileValidator(const FileValidator&) = delete;
    FileValidator& operator=(const FileValidator&) = delete;

    ValidationResult validate(const std::string& filename,
                              const uint8_t* data, size_t size,
                              const std::optional<std::string>& claimed_content_type = std::nullopt) const;

    ValidationResult validate(const std::string& filename,
                              const std::string& content,
                              const std::optional<std::string>& claimed_content_type = std::nullopt) const;

    const common::ValidatorConfig& config() const { return config_; }
    bool scanningConfigured() const { return scanner_ != nullptr; }

private:
    common::ValidatorConfig config_;
    std::unique_ptr<scan::MalwareScanner> scanner_;
    detect::SignatureSniffer sniffer_;
    detect::PolyglotDetector polyglot_;
    detect::PatternScanner patterns_;

    ValidationResult reject(ValidationResult result, core::ValidationErrorCode code,
                            std::string message) const;
    ValidationResult run(const std::string& filename, const uint8_t* data, size_t size,
                         const std::optional<std::string>& claimed_content_type) const;
};

std::string formatMegabytes(uint64_t bytes);

}}
