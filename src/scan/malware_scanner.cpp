#include "upload_guard/scan/malware_scanner.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include "upload_guard/common/paths.hpp"
#include <sstream>
#include <cstring>

namespace upload_guard {
namespace scan {

ScanOutcome ScanOutcome::clean() {
    ScanOutcome outcome;
    outcome.verdict = common::ScanVerdict::CLEAN;
    return outcome;
}

ScanOutcome ScanOutcome::infected(std::string signature) {
    ScanOutcome outcome;
    outcome.verdict = common::ScanVerdict::INFECTED;
    outcome.signature = signature.empty() ? constants::scan_annotations::UNKNOWN_SIGNATURE : std::move(signature);
    return outcome;
}

ScanOutcome ScanOutcome::unavailable(common::UnavailableReason reason, std::string detail) {
    ScanOutcome outcome;
    outcome.verdict = common::ScanVerdict::UNAVAILABLE;
    outcome.reason = reason;
    outcome.detail = std::move(detail);
    return outcome;
}

std::string ScanOutcome::annotation() const {
    switch (verdict) {
        case common::ScanVerdict::CLEAN:
            return constants::scan_annotations::CLEAN;
        case common::ScanVerdict::INFECTED:
            return signature;
        case common::ScanVerdict::UNAVAILABLE:
            switch (reason) {
                case common::UnavailableReason::DISABLED: return constants::scan_annotations::DISABLED;
                case common::UnavailableReason::TIMEOUT: return constants::scan_annotations::TIMEOUT;
                case common::UnavailableReason::ERROR:
                case common::UnavailableReason::NOT_FOUND:
                    return constants::scan_annotations::ERROR;
            }
    }
    return constants::scan_annotations::ERROR;
}

ClamdScanner::ClamdScanner(common::ScannerConfig config)
    : config_(std::move(config)), runner_(constants::limits::MAX_PROCESS_OUTPUT) {
    if (config_.temp_dir.empty()) {
        config_.temp_dir = common::PathManager::instance().getTempDir();
    }
}

bool ClamdScanner::checkVersion() {
    std::vector<std::string> argv = {config_.command, constants::scanner_defaults::VERSION_FLAG};
    auto result = runner_.run(argv, std::chrono::seconds(config_.version_check_timeout_seconds));

    if (!result.started) {
        common::Logger::instance().warn("[ClamdScanner] Version check launch failed | command={} | error={}",
                                       config_.command, std::strerror(result.launch_errno));
        return false;
    }
    if (result.timed_out) {
        common::Logger::instance().warn("[ClamdScanner] Version check timed out | command={} | timeout_s={}",
                                       config_.command, config_.version_check_timeout_seconds);
        return false;
    }
    if (result.exit_code != 0) {
        common::Logger::instance().warn("[ClamdScanner] Version check failed | command={} | exit_code={}",
                                       config_.command, result.exit_code);
        return false;
    }

    std::string version = result.output.substr(0, result.output.find('\n'));
    common::Logger::instance().info("[ClamdScanner] Available | command={} | version={}",
                                   config_.command, version);
    return true;
}

std::string ClamdScanner::parseSignature(const std::string& output, const std::string& path) {
    static const std::string suffix = " FOUND";

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() <= suffix.size() ||
            line.compare(line.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }

        std::string body = line.substr(0, line.size() - suffix.size());
        std::string prefix = path + ": ";
        if (!path.empty() && body.compare(0, prefix.size(), prefix) == 0) {
            body = body.substr(prefix.size());
        } else {
            auto colon = body.rfind(": ");
            if (colon == std::string::npos) {
                continue;
            }
            body = body.substr(colon + 2);
        }

        if (!body.empty()) {
            return body;
        }
    }

    return constants::scan_annotations::UNKNOWN_SIGNATURE;
}

ScanOutcome ClamdScanner::scan(const uint8_t* data, size_t size) {
    common::TempFile temp(config_.temp_dir, constants::system::TEMP_FILE_PREFIX);
    if (!temp.valid() || !temp.write(data, size)) {
        common::Logger::instance().error("[ClamdScanner] Temp file failed | dir={} | error={}",
                                        config_.temp_dir, temp.error());
        return ScanOutcome::unavailable(common::UnavailableReason::ERROR, "temp file: " + temp.error());
    }

    std::vector<std::string> argv;
    argv.push_back(config_.command);
    argv.insert(argv.end(), config_.arguments.begin(), config_.arguments.end());
    argv.push_back(temp.path());

    auto result = runner_.run(argv, std::chrono::seconds(config_.scan_timeout_seconds));

    if (!result.started) {
        common::Logger::instance().error("[ClamdScanner] Launch failed | command={} | error={}",
                                        config_.command, std::strerror(result.launch_errno));
        return ScanOutcome::unavailable(common::UnavailableReason::NOT_FOUND,
                                        std::string("launch failed: ") + std::strerror(result.launch_errno));
    }

    if (result.timed_out) {
        common::Logger::instance().error("[ClamdScanner] Scan timed out | size={} | timeout_s={}",
                                        size, config_.scan_timeout_seconds);
        return ScanOutcome::unavailable(common::UnavailableReason::TIMEOUT,
                                        "no verdict within " + std::to_string(config_.scan_timeout_seconds) + "s");
    }

    switch (result.exit_code) {
        case 0:
            common::Logger::instance().debug("[ClamdScanner] Clean | size={} | elapsed_ms={}",
                                            size, result.elapsed.count());
            return ScanOutcome::clean();
        case 1: {
            std::string signature = parseSignature(result.output, temp.path());
            common::Logger::instance().error("[ClamdScanner] Malware detected | signature={} | size={}",
                                            signature, size);
            return ScanOutcome::infected(signature);
        }
        default: {
            std::string first_line = result.output.substr(0, result.output.find('\n'));
            common::Logger::instance().error("[ClamdScanner] Scan error | exit_code={} | output={}",
                                            result.exit_code, first_line);
            return ScanOutcome::unavailable(common::UnavailableReason::ERROR,
                                            "exit code " + std::to_string(result.exit_code));
        }
    }
}

DisabledScanner::DisabledScanner(std::string detail) : detail_(std::move(detail)) {}

ScanOutcome DisabledScanner::scan(const uint8_t*, size_t) {
    return ScanOutcome::unavailable(common::UnavailableReason::DISABLED, detail_);
}

std::unique_ptr<MalwareScanner> createMalwareScanner(const common::ScannerConfig& config) {
    if (!config.enabled) {
        common::Logger::instance().debug("[MalwareScan] Not enabled");
        return nullptr;
    }

    auto scanner = std::make_unique<ClamdScanner>(config);
    if (!scanner->checkVersion()) {
        common::Logger::instance().warn("[MalwareScan] Scanner unreachable, scanning disabled | command={}",
                                       config.command);
        return std::make_unique<DisabledScanner>("scanner unreachable at startup");
    }

    return scanner;
}

}}
