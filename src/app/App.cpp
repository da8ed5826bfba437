#include "plugctl/app/App.hpp"

#include "plugctl/config/ConfigResolver.hpp"
#include "plugctl/log/Log.hpp"

#include <utility>

namespace plugctl::app {

namespace cfg = plugctl::config;

ExitCode exitCodeFor(cfg::ConfigErrorKind kind) {
    switch (kind) {
        case cfg::ConfigErrorKind::ParseError:  return ExitCode::ConfigParseError;
        case cfg::ConfigErrorKind::NotFound:    return ExitCode::ConfigNotFound;
        case cfg::ConfigErrorKind::UnknownHost: return ExitCode::ConfigNotFound;
    }
    return ExitCode::ConfigNotFound;
}

App::App(cfg::HostCanonicalizer& canonicalizer,
         TransportFactory makeTransport,
         std::ostream& out,
         std::ostream& err)
: canonicalizer(canonicalizer)
, makeTransport(std::move(makeTransport))
, out(out)
, err(err)
{}

int App::run(int argc, const char* const* argv) {
    const std::string program = argc > 0 && argv[0] ? argv[0] : defaults::PLUGCTL_PROGRAM_NAME;

    auto options = parseCommandLine(argc, argv);
    if (!options) {
        err << usage(program);
        return fail(ExitCode::UsageError, options.error());
    }

    if (options->verbose) {
        resetLogHandlers();
    } else {
        setLogHandlers(plugctl::log::discardingHandler(), plugctl::log::discardingHandler());
    }

    if (options->showVersion) {
        out << defaults::PLUGCTL_VERSION << "\n";
        return static_cast<int>(ExitCode::Success);
    }
    if (options->showHelp || !options->host) {
        out << usage(program);
        return static_cast<int>(ExitCode::Success);
    }

    return run(*options);
}

int App::run(const CommandLineOptions& options) {
    if (!options.host) {
        out << usage(defaults::PLUGCTL_PROGRAM_NAME);
        return static_cast<int>(ExitCode::Success);
    }

    cfg::ConfigResolver resolver(canonicalizer);
    auto identity = resolver.resolve(*options.host,
                                     cfg::CredentialOverrides{options.deviceId, options.deviceKey},
                                     cfg::fileTableLoader(options.configPath));
    if (!identity) {
        logInfo("[App] ", cfg::toString(identity.error().kind), ": ",
                identity.error().subject, "\n");
        return fail(exitCodeFor(identity.error().kind), identity.error().message);
    }

    auto created = device::DeviceController::create(*identity, makeTransport(*identity));
    if (!created) {
        return fail(ExitCode::DeviceFailure, created.error().describe());
    }
    auto& controller = *created;
    logInfo("[App] ", toString(options.command), " ", identity->host(),
            " (id ", identity->deviceId(), ")\n");

    switch (options.command) {
        case Command::Off:
        case Command::On: {
            auto result = options.command == Command::On ? controller.turnOn() : controller.turnOff();
            if (!result) {
                return fail(ExitCode::DeviceFailure, result.error().describe());
            }
            break;
        }
        case Command::Toggle: {
            auto result = controller.toggle();
            if (!result) {
                return fail(ExitCode::DeviceFailure, result.error().describe());
            }
            break;
        }
        case Command::State: {
            auto result = controller.getState();
            if (!result) {
                return fail(ExitCode::DeviceFailure, result.error().describe());
            }
            out << device::toInt(*result) << "\n";
            break;
        }
    }

    out.flush();
    return static_cast<int>(ExitCode::Success);
}

int App::fail(ExitCode code, const std::string& message) {
    err << defaults::PLUGCTL_ERROR_PREFIX << message << "\n";
    err.flush();
    return static_cast<int>(code);
}

} // namespace plugctl::app
