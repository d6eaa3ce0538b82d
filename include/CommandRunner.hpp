#pragma once
#include <functional>
#include <string>

namespace TrapWatch {

struct CommandResult {
    // Shell exit status, or -1 when the process could not be started
    int exitCode{-1};
    std::string output;
};

using CommandExecutor = std::function<CommandResult(const std::string& command)>;

CommandResult runCommand(const std::string& command);

// Single-quotes value for /bin/sh
std::string shellQuote(const std::string& value);

} // namespace TrapWatch
