#include "main_command.hpp"

namespace upload_guard {
namespace cli {

MainCommand::MainCommand(common::Config& config) : config_(config) {}
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

}}
