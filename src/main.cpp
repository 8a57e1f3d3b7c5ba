#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "upload_guard/common/config.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include "cli/main_command.hpp"
#include "cli/validate_command.hpp"
#include "cli/config_command.hpp"

namespace ug = upload_guard;

int main(int argc, char** argv) {
    CLI::App app{"Upload content validator", ug::constants::system::APPLICATION_NAME};
    app.set_version_flag("--version,-v", ug::constants::version::getFullVersion());
    app.require_subcommand(0, 1);

    std::string config_file;
    std::string log_level;
    app.add_option("--config", config_file, "Configuration file path");
    app.add_option("--log-level", log_level, "Log level (debug, info, warn, error)");

    ug::common::Config config;

    auto validate_cmd = std::make_unique<ug::cli::ValidateCommand>(config);
    auto config_cmd = std::make_unique<ug::cli::ConfigCommand>(config);

    validate_cmd->setup(app.add_subcommand("validate", "Validate uploaded files"));
    config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? ug::cli::exit_codes::OK : ug::cli::exit_codes::USAGE;
    }

    try {
        if (!config.load(config_file)) {
            std::cerr << "Error: Failed to load configuration: " << config.lastError() << std::endl;
            return ug::cli::exit_codes::USAGE;
        }

        if (!log_level.empty()) {
            auto level = ug::common::parseLogLevel(log_level);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << log_level << std::endl;
                return ug::cli::exit_codes::USAGE;
            }
            config.setLogLevel(*level);
        }

        ug::common::Logger::instance().initialize(config.global());

        int rc = ug::cli::exit_codes::OK;
        if (validate_cmd->wasCalled()) {
            rc = validate_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            rc = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }

        ug::common::Logger::instance().shutdown();
        return rc;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return ug::cli::exit_codes::USAGE;
    }
}
