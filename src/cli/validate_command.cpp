#include "validate_command.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include "upload_guard/scan/malware_scanner.hpp"
#include <iostream>
#include <iterator>
#include <unistd.h>

namespace upload_guard {
namespace cli {

ValidateCommand::ValidateCommand(common::Config& config) : MainCommand(config) {}

void ValidateCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    subcommand->add_option("target", target_path_, "File or directory to validate ('-' reads stdin)")
               ->required();

    subcommand->add_option("-n,--name", name_,
                          "Upload filename used for the extension check (default: file name)");
    subcommand->add_option("-c,--content-type", content_type_,
                          "Claimed Content-Type to cross-check");
    subcommand->add_option("-p,--profile", profile_,
                          "Validation profile")
                          ->check(CLI::IsMember(std::vector<std::string>{constants::profiles::DEFAULT, constants::profiles::IMAGE}));
    subcommand->add_option("-m,--max-size", max_size_,
                          "Maximum file size in bytes (default: from config)")
                          ->check(CLI::PositiveNumber);
    auto scan_flag = subcommand->add_flag("--scan", force_scan_, "Enable malware scanning");
    auto no_scan_flag = subcommand->add_flag("--no-scan", no_scan_, "Disable malware scanning");
    scan_flag->excludes(no_scan_flag);
    subcommand->add_flag("-r,--recursive", recursive_,
                        "Recurse into subdirectories");
    subcommand->add_option("-t,--threads", threads_,
                          "Number of worker threads")
                          ->check(CLI::Range(1, 64));
    subcommand->add_flag("--json", json_output_,
                        "Output as JSON");
    subcommand->add_flag("-q,--quiet", quiet_,
                        "Only print rejected files");

    subcommand->callback([this]() { was_called_ = true; });
}

bool ValidateCommand::validateArguments() const {
    if (target_path_ == "-" && name_.empty()) {
        std::cerr << "Error: --name is required when reading from stdin" << std::endl;
        return false;
    }
    return true;
}

bool ValidateCommand::applyOverrides() {
    if (!profile_.empty() && !config_.applyProfile(profile_)) {
        std::cerr << "Error: " << config_.lastError() << std::endl;
        return false;
    }
    if (max_size_ > 0) {
        config_.setMaxFileSize(max_size_);
    }
    if (force_scan_) {
        config_.setScanEnabled(true);
    } else if (no_scan_) {
        config_.setScanEnabled(false);
    }
    return true;
}

std::optional<std::string> ValidateCommand::claimedType() const {
    if (content_type_.empty()) {
        return std::nullopt;
    }
    return content_type_;
}

int ValidateCommand::execute() {
    if (!validateArguments() || !applyOverrides()) {
        return exit_codes::USAGE;
    }

    const auto& validator_config = config_.global().validator;
    auto scanner = scan::createMalwareScanner(validator_config.scanner);
    validate::FileValidator validator(validator_config, std::move(scanner));

    validate::ResultFormatter formatter(json_output_ ? validate::OutputFormat::JSON
                                                     : validate::OutputFormat::TEXT);
    formatter.setColorsEnabled(isatty(STDOUT_FILENO));

    if (target_path_ == "-") {
        return validateStdin(validator, formatter);
    }

    std::filesystem::path target(target_path_);
    std::error_code ec;
    if (!std::filesystem::exists(target, ec)) {
        std::cerr << "Error: Path not found: " << target_path_ << std::endl;
        return exit_codes::USAGE;
    }

    if (std::filesystem::is_directory(target, ec)) {
        return validateDirectory(validator, formatter, target);
    }
    return validateSingle(validator, formatter, target);
}

int ValidateCommand::validateStdin(const validate::FileValidator& validator,
                                   validate::ResultFormatter& formatter) {
    std::string content((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());

    validate::FileReport report;
    report.path = "<stdin>";
    report.name = name_;
    report.result = validator.validate(name_, content, claimedType());

    if (shouldPrint(report)) {
        formatter.formatReport(report, std::cout);
    }
    return exitCodeFor(report);
}

int ValidateCommand::validateSingle(const validate::FileValidator& validator,
                                    validate::ResultFormatter& formatter,
                                    const std::filesystem::path& path) {
    validate::BatchValidator batch(validator);
    std::optional<std::string> display_name;
    if (!name_.empty()) {
        display_name = name_;
    }

    auto report = batch.validateFile(path, display_name, claimedType());
    if (shouldPrint(report)) {
        formatter.formatReport(report, std::cout);
    }
    return exitCodeFor(report);
}

int ValidateCommand::validateDirectory(const validate::FileValidator& validator,
                                       validate::ResultFormatter& formatter,
                                       const std::filesystem::path& path) {
    if (!name_.empty()) {
        std::cerr << "Warning: --name is ignored for directory targets" << std::endl;
    }

    validate::BatchOptions options;
    options.recursive = recursive_;
    options.max_threads = threads_ > 0 ? threads_ : constants::limits::DEFAULT_BATCH_THREADS;
    options.claimed_content_type = claimedType();

    validate::BatchValidator batch(validator);
    auto summary = batch.validateDirectory(path, options);

    if (json_output_) {
        formatter.formatSummary(summary, std::cout);
    } else {
        for (const auto& report : summary.reports) {
            if (shouldPrint(report)) {
                formatter.formatReport(report, std::cout);
            }
        }
        if (!quiet_) {
            formatter.formatSummary(summary, std::cout);
        }
    }

    return (summary.rejected > 0 || summary.unreadable > 0) ? exit_codes::REJECTED : exit_codes::OK;
}

bool ValidateCommand::shouldPrint(const validate::FileReport& report) const {
    if (!quiet_) {
        return true;
    }
    return !report.result || !report.result->is_valid;
}

int ValidateCommand::exitCodeFor(const validate::FileReport& report) {
    return (report.result && report.result->is_valid) ? exit_codes::OK : exit_codes::REJECTED;
}

}}
