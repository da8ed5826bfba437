#include "plugctl/config/DeviceTable.hpp"
#include "plugctl/log/Log.hpp"

#include "TempFile.hpp"

#include <cstdio>
#include <initializer_list>
#include <string>

using plugctl::config::ConfigErrorKind;
using plugctl::config::DeviceTable;
using plugctl::testing::TempFile;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { std::fprintf(stderr, "ASSERT TRUE FAILED: %s @ %s:%d\n", \
        (msg), __FILE__, __LINE__); ++g_failures; } } while (0)

#define ASSERT_EQ(a, b, msg) \
    do { if (!((a) == (b))) { std::fprintf(stderr, "ASSERT EQ FAILED: %s @ %s:%d\n", \
        (msg), __FILE__, __LINE__); ++g_failures; } } while (0)

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

static void testParseValidTable() {
    auto table = DeviceTable::parse(R"({
        "plug0.home.lan": ["7553155390339f8fa571", "f201b3618e4f3f10"],
        "192.168.1.40":   ["744315537003af8f9571", "f94j23118e2f5810", "ignored"]
    })", "inline");

    ASSERT_TRUE(table.has_value(), "valid table parses");
    if (!table) return;
    ASSERT_EQ(table->size(), static_cast<std::size_t>(2), "two entries");

    auto plug = table->find("plug0.home.lan");
    ASSERT_TRUE(plug && plug->has_value(), "name entry found");
    if (plug && *plug) {
        ASSERT_EQ((*plug)->deviceId, std::string("7553155390339f8fa571"), "id is first");
        ASSERT_EQ((*plug)->deviceKey, std::string("f201b3618e4f3f10"), "key is second");
    }

    auto byAddress = table->find("192.168.1.40");
    ASSERT_TRUE(byAddress && *byAddress && (*byAddress)->deviceKey == "f94j23118e2f5810",
                "extra elements ignored");

    auto partial = table->find("plug0");
    ASSERT_TRUE(partial && !partial->has_value(), "no partial matches");
    auto upper = table->find("PLUG0.HOME.LAN");
    ASSERT_TRUE(upper && !upper->has_value(), "keys are case sensitive");
}

static void testEmptyObjectIsAnEmptyTable() {
    auto table = DeviceTable::parse("{}", "inline");
    ASSERT_TRUE(table && table->empty(), "empty object is valid");
}

static void testInvalidJsonIsParseError() {
    auto table = DeviceTable::parse(R"({"plug0": ["a", "b"],})", "/etc/plugs.json");
    ASSERT_TRUE(!table, "trailing comma rejected");
    if (table) return;
    ASSERT_TRUE(table.error().kind == ConfigErrorKind::ParseError, "parse error kind");
    ASSERT_EQ(table.error().subject, std::string("/etc/plugs.json"), "subject is the source");
    ASSERT_TRUE(contains(table.error().message, "In config file /etc/plugs.json"), "message names the file");
}

static void testTopLevelMustBeAnObject() {
    for (const char* doc : {R"(["plug0", "a", "b"])", "42", R"("plug0")"}) {
        auto table = DeviceTable::parse(doc, "inline");
        ASSERT_TRUE(!table, doc);
        if (!table) {
            ASSERT_TRUE(table.error().kind == ConfigErrorKind::ParseError, doc);
        }
    }
}

static void testMalformedEntryFailsOnlyItsOwnLookup() {
    auto table = DeviceTable::parse(R"({
        "good.home.example": ["dev123", "key456"],
        "string.home.example": "a",
        "short.home.example": ["only-id"],
        "empty.home.example": ["", "key"],
        "number.home.example": ["id", 42]
    })", "/etc/plugs.json");
    ASSERT_TRUE(table.has_value(), "bad entries do not fail the load");
    if (!table) return;

    auto good = table->find("good.home.example");
    ASSERT_TRUE(good && *good && (*good)->deviceId == "dev123", "valid sibling still resolves");

    for (const char* host : {"string.home.example", "short.home.example",
                             "empty.home.example", "number.home.example"}) {
        auto bad = table->find(host);
        ASSERT_TRUE(!bad, host);
        if (!bad) {
            ASSERT_TRUE(bad.error().kind == ConfigErrorKind::ParseError, host);
            ASSERT_EQ(bad.error().subject, std::string("/etc/plugs.json"), "subject is the source");
            ASSERT_TRUE(contains(bad.error().message, host), "message names the bad entry");
        }
    }
}

static void testLoadFromFile() {
    TempFile file("table", R"({"apb0.home.example": ["dev123", "key456"]})");
    auto table = DeviceTable::load(file.path());
    ASSERT_TRUE(table.has_value(), "file loads");
    if (!table) return;
    auto entry = table->find("apb0.home.example");
    ASSERT_TRUE(entry && *entry && (*entry)->deviceId == "dev123" && (*entry)->deviceKey == "key456",
                "entry read");
}

static void testLoadMissingFileIsNotFound() {
    const std::string path = "/nonexistent/plugctl/devices.json";
    auto table = DeviceTable::load(path);
    ASSERT_TRUE(!table, "missing file fails");
    if (table) return;
    ASSERT_TRUE(table.error().kind == ConfigErrorKind::NotFound, "not found kind");
    ASSERT_EQ(table.error().subject, path, "subject is the path");
    ASSERT_TRUE(contains(table.error().message, path), "message names the path");
}

static void testLoadMalformedFileIsParseError() {
    TempFile file("broken", "{ not json");
    auto table = DeviceTable::load(file.path());
    ASSERT_TRUE(!table && table.error().kind == ConfigErrorKind::ParseError, "malformed file");
}

int main() {
    plugctl::log::setLogHandlers(plugctl::log::discardingHandler(),
                                 plugctl::log::discardingHandler());

    testParseValidTable();
    testEmptyObjectIsAnEmptyTable();
    testInvalidJsonIsParseError();
    testTopLevelMustBeAnObject();
    testMalformedEntryFailsOnlyItsOwnLookup();
    testLoadFromFile();
    testLoadMissingFileIsNotFound();
    testLoadMalformedFileIsParseError();

    if (g_failures) {
        std::fprintf(stderr, "DeviceTable tests failed: %d failure(s)\n", g_failures);
        return 1;
    }
    std::puts("DeviceTable tests passed.");
    return 0;
}
