#pragma once

#include "plugctl/app/AppConfig.hpp"
#include "plugctl/core/Expected.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace plugctl::app {

enum class Command {
    Off,
    On,
    Toggle,
    State
};

/// Accepts off/0, on/1, toggle/t, state/s/status.
std::optional<Command> parseCommand(std::string_view word);
const char* toString(Command command);

struct CommandLineOptions {
    std::optional<std::string> host;
    Command command = Command::State;
    std::optional<std::string> deviceId;
    std::optional<std::string> deviceKey;
    std::string configPath = defaults::PLUGCTL_DEVICE_TABLE_PATH;
    bool showVersion = false;
    bool showHelp = false;
    bool verbose = false;
};

/**
 * @brief Parse `plugctl [options] [host] [command]`.
 *
 * Options may appear anywhere; `--name value`, `--name=value` and
 * `-x value` are all accepted and `--` ends option parsing. The error is a
 * one-line message suitable for printing after the error prefix.
 */
expected<CommandLineOptions, std::string> parseCommandLine(int argc, const char* const* argv);

std::string usage(std::string_view program);

} // namespace plugctl::app
