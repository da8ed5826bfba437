#include "plugctl/app/CommandLine.hpp"

#include <sstream>
#include <vector>

namespace plugctl::app {

namespace {

enum class ValueOption { None, Id, Key, Config };

ValueOption valueOptionFor(std::string_view name) {
    if (name == "-d" || name == "--id") return ValueOption::Id;
    if (name == "-k" || name == "--key") return ValueOption::Key;
    if (name == "-f" || name == "--config") return ValueOption::Config;
    return ValueOption::None;
}

void store(CommandLineOptions& options, ValueOption option, std::string value) {
    switch (option) {
        case ValueOption::Id:     options.deviceId = std::move(value); break;
        case ValueOption::Key:    options.deviceKey = std::move(value); break;
        case ValueOption::Config: options.configPath = std::move(value); break;
        case ValueOption::None:   break;
    }
}

} // namespace

std::optional<Command> parseCommand(std::string_view word) {
    if (word == "off" || word == "0") return Command::Off;
    if (word == "on" || word == "1") return Command::On;
    if (word == "toggle" || word == "t") return Command::Toggle;
    if (word == "state" || word == "s" || word == "status") return Command::State;
    return std::nullopt;
}

const char* toString(Command command) {
    switch (command) {
        case Command::Off:    return "off";
        case Command::On:     return "on";
        case Command::Toggle: return "toggle";
        case Command::State:  return "state";
    }
    return "unknown";
}

expected<CommandLineOptions, std::string> parseCommandLine(int argc, const char* const* argv) {
    CommandLineOptions options;
    std::vector<std::string> positionals;
    bool optionsEnded = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (optionsEnded || arg.size() < 2 || arg[0] != '-') {
            positionals.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsEnded = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }

        std::string_view name = arg;
        std::optional<std::string> inlineValue;
        if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string_view::npos) {
            name = arg.substr(0, eq);
            inlineValue = std::string(arg.substr(eq + 1));
        }

        const auto option = valueOptionFor(name);
        if (option == ValueOption::None) {
            return unexpected("unrecognized option: " + std::string(arg));
        }
        if (inlineValue) {
            store(options, option, std::move(*inlineValue));
            continue;
        }
        if (i + 1 >= argc) {
            return unexpected("option " + std::string(name) + " expects a value");
        }
        store(options, option, argv[++i]);
    }

    if (positionals.size() > 2) {
        return unexpected("unexpected argument: " + positionals[2]);
    }
    if (!positionals.empty()) {
        options.host = positionals[0];
    }
    if (positionals.size() == 2) {
        const auto command = parseCommand(positionals[1]);
        if (!command) {
            return unexpected("invalid command: '" + positionals[1] +
                              "' (choose from on, 1, off, 0, toggle, t, state, s, status)");
        }
        options.command = *command;
    }
    return options;
}

std::string usage(std::string_view program) {
    std::ostringstream os;
    os << "usage: " << program << " [-h] [-v] [--verbose] [-k KEY] [-d ID] [-f CONFIG] [host] [cmd]\n"
       << "\n"
       << "positional arguments:\n"
       << "  host                  hostname or IP number of the device\n"
       << "  cmd                   one of: on (1), off (0), toggle (t), state (s, status);\n"
       << "                        default is state\n"
       << "\n"
       << "options:\n"
       << "  -h, --help            show this help message and exit\n"
       << "  -v, --version         show version number and exit\n"
       << "  --verbose             log protocol activity to stderr\n"
       << "  -k, --key KEY         device local key\n"
       << "  -d, --id ID           device id\n"
       << "  -f, --config CONFIG   path to the JSON device table, default is "
       << defaults::PLUGCTL_DEVICE_TABLE_PATH << "\n";
    return os.str();
}

} // namespace plugctl::app
