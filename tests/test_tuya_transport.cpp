#include "plugctl/device/DeviceController.hpp"
#include "plugctl/log/Log.hpp"
#include "plugctl/tuya/TuyaOutletTransport.hpp"

#include "FakeTuyaDevice.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace plugctl;
using plugctl::testing::FakeTuyaDevice;
using plugctl::tuya::TuyaOutletTransport;
using plugctl::tuya::TuyaSettings;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { std::fprintf(stderr, "ASSERT TRUE FAILED: %s @ %s:%d\n", \
        (msg), __FILE__, __LINE__); ++g_failures; } } while (0)

#define ASSERT_EQ(a, b, msg) \
    do { if (!((a) == (b))) { std::fprintf(stderr, "ASSERT EQ FAILED: %s @ %s:%d\n", \
        (msg), __FILE__, __LINE__); ++g_failures; } } while (0)

namespace {

const std::string kDeviceId = "dev123";
const std::string kLocalKey = "k3y-f0r-t3st1ng!";

TuyaSettings loopbackSettings(unsigned short port) {
    TuyaSettings settings;
    settings.deviceId = kDeviceId;
    settings.address = "127.0.0.1";
    settings.localKey = kLocalKey;
    settings.port = port;
    settings.socketRetryLimit = 2;
    settings.socketTimeout = 500ms;
    settings.retryBackoff = 10ms;
    return settings;
}

// A loopback port with nothing listening on it.
unsigned short closedPort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    unsigned short port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(fd);
    return port;
}

std::string errorCode(const device::TransportRecord& record) {
    return record.value(device::keys::ERROR_CODE, std::string{});
}

} // namespace

static void testStatusAndControl() {
    FakeTuyaDevice plug(kLocalKey);
    ASSERT_TRUE(plug.listening(), "fake device listening");
    if (!plug.listening()) return;

    std::string activity;
    plugctl::log::setInfoLogHandler([&activity](std::string_view message) { activity += message; });

    TuyaOutletTransport transport(loopbackSettings(plug.port()));

    auto first = transport.status();
    plugctl::log::setInfoLogHandler(plugctl::log::discardingHandler());
    ASSERT_TRUE(activity.find("connected to 127.0.0.1") != std::string::npos, "connection logged");
    ASSERT_TRUE(!first.contains("Error"), "status succeeds");
    ASSERT_EQ(first["dps"]["1"], nlohmann::json(false), "plug starts off");

    auto ack = transport.setStatus(true, 1);
    ASSERT_TRUE(!ack.contains("Error"), "control succeeds");
    ASSERT_TRUE(plug.isOn(), "device switched on");

    // The status push that followed the ack is still queued and must be skipped.
    auto second = transport.status();
    ASSERT_EQ(second["dps"]["1"], nlohmann::json(true), "status reflects the switch");
    ASSERT_EQ(plug.connectionsAccepted(), 1, "one connection reused across calls");

    const auto commands = plug.commandsSeen();
    ASSERT_EQ(commands.size(), static_cast<std::size_t>(3), "three requests");
    if (commands.size() == 3) {
        ASSERT_EQ(commands[0], 10u, "dp_query");
        ASSERT_EQ(commands[1], 7u, "control");
        ASSERT_EQ(commands[2], 10u, "dp_query");
    }

    const auto bodies = plug.requestBodies();
    if (bodies.size() == 3) {
        ASSERT_EQ(bodies[0]["devId"], nlohmann::json(kDeviceId), "query names the device");
        ASSERT_EQ(bodies[0]["gwId"], nlohmann::json(kDeviceId), "query carries gwId");
        ASSERT_EQ(bodies[1]["dps"]["1"], nlohmann::json(true), "control writes switch 1");
        ASSERT_TRUE(bodies[1]["t"].is_string(), "control carries a timestamp");
    }
}

static void testControllerOverTuya() {
    FakeTuyaDevice plug(kLocalKey);
    if (!plug.listening()) {
        ASSERT_TRUE(false, "fake device listening");
        return;
    }
    plug.setOn(true);

    auto created = device::DeviceController::create(
        core::DeviceIdentity("127.0.0.1", kDeviceId, kLocalKey),
        std::make_unique<TuyaOutletTransport>(loopbackSettings(plug.port())));
    ASSERT_TRUE(created.has_value(), "controller built");
    if (!created) return;
    auto& controller = *created;

    auto state = controller.getState();
    ASSERT_TRUE(state && *state == device::DeviceState::On, "reads On");

    auto toggled = controller.toggle();
    ASSERT_TRUE(toggled && *toggled == device::DeviceState::Off, "toggle returns Off");
    ASSERT_TRUE(!plug.isOn(), "device is off");

    ASSERT_TRUE(controller.turnOn().has_value(), "turnOn");
    auto after = controller.getState();
    ASSERT_TRUE(after && *after == device::DeviceState::On, "reads On again");
}

static void testDevice22FallsBackToControlNew() {
    FakeTuyaDevice plug(kLocalKey, FakeTuyaDevice::Mode::Device22);
    if (!plug.listening()) {
        ASSERT_TRUE(false, "fake device listening");
        return;
    }
    plug.setOn(true);

    TuyaOutletTransport transport(loopbackSettings(plug.port()));
    ASSERT_TRUE(!transport.usesDevice22Queries(), "starts with plain queries");

    auto record = transport.status();
    ASSERT_TRUE(!record.contains("Error"), "status succeeds after fallback");
    ASSERT_EQ(record["dps"]["1"], nlohmann::json(true), "reads the switch");
    ASSERT_TRUE(transport.usesDevice22Queries(), "fallback remembered");

    auto again = transport.status();
    ASSERT_EQ(again["dps"]["1"], nlohmann::json(true), "second read still works");

    const auto commands = plug.commandsSeen();
    ASSERT_EQ(commands.size(), static_cast<std::size_t>(3), "query, then two control_new");
    if (commands.size() == 3) {
        ASSERT_EQ(commands[0], 10u, "dp_query first");
        ASSERT_EQ(commands[1], 13u, "control_new");
        ASSERT_EQ(commands[2], 13u, "control_new again");
    }
    const auto bodies = plug.requestBodies();
    if (bodies.size() == 3) {
        ASSERT_TRUE(bodies[1]["dps"]["1"].is_null(), "control_new asks with a null value");
    }
}

static void testRefusedConnection() {
    const auto port = closedPort();
    ASSERT_TRUE(port != 0, "found a free port");

    std::string errors;
    plugctl::log::setErrorLogHandler([&errors](std::string_view message) { errors += message; });

    TuyaOutletTransport transport(loopbackSettings(port));
    auto record = transport.status();
    plugctl::log::setErrorLogHandler(plugctl::log::discardingHandler());

    ASSERT_TRUE(errors.find("giving up on 127.0.0.1 after 2 attempt(s)") != std::string::npos,
                "exhaustion logged");
    ASSERT_EQ(errorCode(record), std::string("901"), "refused connect reported as 901");
    ASSERT_EQ(record["Error"], nlohmann::json("Network Error: Unable to Connect"), "message");

    auto ack = transport.setStatus(false, 1);
    ASSERT_EQ(errorCode(ack), std::string("901"), "control fails the same way");
}

static void testSilentDeviceTimesOut() {
    FakeTuyaDevice plug(kLocalKey, FakeTuyaDevice::Mode::Silent);
    if (!plug.listening()) {
        ASSERT_TRUE(false, "fake device listening");
        return;
    }

    TuyaOutletTransport transport(loopbackSettings(plug.port()));
    const auto started = std::chrono::steady_clock::now();
    auto record = transport.status();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(errorCode(record), std::string("902"), "no reply reported as 902");
    ASSERT_EQ(plug.commandsSeen().size(), static_cast<std::size_t>(2), "one request per attempt");
    ASSERT_TRUE(elapsed >= 1000ms, "both attempts waited for the timeout");
    ASSERT_TRUE(elapsed < 5s, "retries are bounded");
}

static void testBadKeyFailsBeforeConnecting() {
    FakeTuyaDevice plug(kLocalKey);
    if (!plug.listening()) {
        ASSERT_TRUE(false, "fake device listening");
        return;
    }

    auto settings = loopbackSettings(plug.port());
    settings.localKey = "too-short";
    TuyaOutletTransport transport(settings);

    auto record = transport.status();
    ASSERT_EQ(errorCode(record), std::string("914"), "short key reported as 914");
    ASSERT_EQ(plug.connectionsAccepted(), 0, "nothing sent");
}

static void testProductionDefaults() {
    auto transport = tuya::makeTuyaTransport(core::DeviceIdentity("plug0.lan", kDeviceId, kLocalKey));
    auto* tuyaTransport = dynamic_cast<TuyaOutletTransport*>(transport.get());
    ASSERT_TRUE(tuyaTransport != nullptr, "factory builds a Tuya transport");
    if (!tuyaTransport) return;

    const auto& settings = tuyaTransport->settings();
    ASSERT_EQ(settings.address, std::string("plug0.lan"), "connects to the given host");
    ASSERT_EQ(settings.deviceId, kDeviceId, "device id");
    ASSERT_EQ(settings.localKey, kLocalKey, "local key");
    ASSERT_EQ(settings.version, std::string("3.3"), "protocol 3.3");
    ASSERT_EQ(settings.port, 6668, "default port");
    ASSERT_EQ(settings.socketRetryLimit, 4, "four attempts");
    ASSERT_TRUE(settings.socketTimeout == std::chrono::milliseconds(4000), "four second timeout");
}

int main() {
    plugctl::log::setLogHandlers(plugctl::log::discardingHandler(),
                                 plugctl::log::discardingHandler());

    testProductionDefaults();
    testStatusAndControl();
    testControllerOverTuya();
    testDevice22FallsBackToControlNew();
    testRefusedConnection();
    testSilentDeviceTimesOut();
    testBadKeyFailsBeforeConnecting();

    if (g_failures) {
        std::fprintf(stderr, "Tuya transport tests failed: %d failure(s)\n", g_failures);
        return 1;
    }
    std::puts("Tuya transport tests passed.");
    return 0;
}
