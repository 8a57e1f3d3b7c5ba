#pragma once

#include "../common/config.hpp"
#include "../common/types.hpp"
#include "../common/process.hpp"
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace upload_guard {
namespace scan {

struct ScanOutcome {
    common::ScanVerdict verdict = common::ScanVerdict::UNAVAILABLE;
    std::string signature;
    common::UnavailableReason reason = common::UnavailableReason::ERROR;
    std::string detail;

    static ScanOutcome clean();
    static ScanOutcome infected(std::string signature);
    static ScanOutcome unavailable(common::UnavailableReason reason, std::string detail);

    // CLEAN, the signature name, or one of SCAN_DISABLED / SCAN_TIMEOUT / SCAN_ERROR.
    std::string annotation() const;
};

class MalwareScanner {
public:
    virtual ~MalwareScanner() = default;

    virtual ScanOutcome scan(const uint8_t* data, size_t size) = 0;
    virtual std::string name() const = 0;
};

// Hands the bytes to the clamdscan client through a scoped temporary file.
// Exit 0 is clean, exit 1 is a detection, anything else is a scan error.
class ClamdScanner : public MalwareScanner {
public:
    explicit ClamdScanner(common::ScannerConfig config);

    ScanOutcome scan(const uint8_t* data, size_t size) override;
    std::string name() const override { return config_.command; }

    bool checkVersion();

    static std::string parseSignature(const std::string& output, const std::string& path);

private:
    common::ScannerConfig config_;
    common::ProcessRunner runner_;
};

// Placeholder used when scanning was requested but the startup version check failed.
class DisabledScanner : public MalwareScanner {
public:
    explicit DisabledScanner(std::string detail);

    ScanOutcome scan(const uint8_t* data, size_t size) override;
    std::string name() const override { return "disabled"; }

private:
    std::string detail_;
};

// nullptr when scanning is not enabled. When enabled but the version check fails, a
// DisabledScanner is returned and one warning is logged.
std::unique_ptr<MalwareScanner> createMalwareScanner(const common::ScannerConfig& config);

}}
