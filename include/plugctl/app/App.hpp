#pragma once

#include "plugctl/app/CommandLine.hpp"
#include "plugctl/config/ConfigError.hpp"
#include "plugctl/config/HostCanonicalizer.hpp"
#include "plugctl/core/DeviceIdentity.hpp"
#include "plugctl/device/DeviceController.hpp"
#include "plugctl/device/OutletTransport.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace plugctl::app {

enum class ExitCode : int {
    Success = 0,
    ConfigParseError = 1,
    ConfigNotFound = 2,   ///< also unknown host
    UsageError = 2,
    DeviceFailure = 3
};

ExitCode exitCodeFor(plugctl::config::ConfigErrorKind kind);

using TransportFactory =
    std::function<std::unique_ptr<device::OutletTransport>(const core::DeviceIdentity&)>;

/**
 * @brief One invocation of the controller: resolve, connect, run one command, report.
 *
 * `out` receives only the requested data (the state on `state`); every
 * failure is a single `ERROR: ` line on `err` and a non-zero exit code.
 */
class App {
public:
    App(plugctl::config::HostCanonicalizer& canonicalizer,
        TransportFactory makeTransport,
        std::ostream& out,
        std::ostream& err);

    /// Parses argv, handles help/version and logging, then runs the command.
    int run(int argc, const char* const* argv);

    int run(const CommandLineOptions& options);

private:
    int fail(ExitCode code, const std::string& message);

    plugctl::config::HostCanonicalizer& canonicalizer;
    TransportFactory makeTransport;
    std::ostream& out;
    std::ostream& err;
};

} // namespace plugctl::app
