#include "config_command.hpp"
#include "upload_guard/config/config_validator.hpp"
#include <iostream>

namespace upload_guard {
namespace cli {

ConfigCommand::ConfigCommand(common::Config& config) : MainCommand(config) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }

    std::cout << subcommand_->help() << std::endl;
    return exit_codes::OK;
}

int ConfigCommand::executeShow() {
    if (config_.loadedFromFile()) {
        std::cout << "# Configuration file: " << config_.getConfigPath() << "\n";
    } else {
        std::cout << "# No configuration file found, showing defaults\n";
    }
    std::cout << "# Environment overrides applied\n\n";
    std::cout << config_.dump() << std::endl;
    return exit_codes::OK;
}

int ConfigCommand::executeValidate() {
    std::cout << "Validating: "
              << (config_.loadedFromFile() ? config_.getConfigPath() : std::string("(defaults)"))
              << "\n\n";

    config::ConfigValidator validator;
    auto result = validator.validate(config_.global());

    std::cout << (result.is_valid ? "Configuration: Valid\n" : "Configuration: Invalid\n");

    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }

    std::cout << "\nErrors: " << result.errors.size()
              << "  Warnings: " << result.warnings.size() << "\n";

    return result.is_valid ? exit_codes::OK : exit_codes::USAGE;
}

}}
