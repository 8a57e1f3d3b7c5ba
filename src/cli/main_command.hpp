#pragma once

#include "upload_guard/common/config.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace upload_guard {
namespace cli {

namespace exit_codes {
    constexpr int OK = 0;
    constexpr int REJECTED = 1;
    constexpr int USAGE = 2;
}

class MainCommand {
public:
    explicit MainCommand(common::Config& config);
    virtual ~MainCommand();

    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;
    virtual bool validateArguments() const;

    bool wasCalled() const { return was_called_; }

protected:
    CLI::App* subcommand_ = nullptr;
    common::Config& config_;
    bool was_called_ = false;
};

}}
