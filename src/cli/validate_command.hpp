#pragma once

#include "main_command.hpp"
#include "upload_guard/validate/batch_validator.hpp"
#include "upload_guard/validate/result_formatter.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <filesystem>
#include <optional>

namespace upload_guard {
namespace cli {

class ValidateCommand : public MainCommand {
public:
    explicit ValidateCommand(common::Config& config);

    void setup(CLI::App* subcommand) override;
    int execute() override;
    bool validateArguments() const override;

private:
    std::string target_path_;
    std::string name_;
    std::string content_type_;
    std::string profile_;
    uint64_t max_size_ = 0;
    bool force_scan_ = false;
    bool no_scan_ = false;
    bool recursive_ = false;
    int threads_ = 0;
    bool json_output_ = false;
    bool quiet_ = false;

    bool applyOverrides();
    int validateStdin(const validate::FileValidator& validator, validate::ResultFormatter& formatter);
    int validateSingle(const validate::FileValidator& validator, validate::ResultFormatter& formatter,
                       const std::filesystem::path& path);
    int validateDirectory(const validate::FileValidator& validator, validate::ResultFormatter& formatter,
                          const std::filesystem::path& path);

    std::optional<std::string> claimedType() const;
    bool shouldPrint(const validate::FileReport& report) const;
    static int exitCodeFor(const validate::FileReport& report);
};

}}
