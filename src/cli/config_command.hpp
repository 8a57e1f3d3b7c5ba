#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace upload_guard {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    explicit ConfigCommand(common::Config& config);

    void setup(CLI::App* subcommand) override;
    int execute() override;

private:
    CLI::App* show_cmd_ = nullptr;
    CLI::App* validate_cmd_ = nullptr;

    int executeShow();
    int executeValidate();
};

}}
