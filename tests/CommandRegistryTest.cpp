#include <catch2/catch.hpp>

#include "core/AssetError.h"
#include "core/CommandRegistry.h"

using namespace FRLGRender;

namespace {

CommandTable recordingTable(std::vector<std::string>& received) {
    CommandTable table;
    table["map"].help = "maps";
    table["map"].actions["cell"] = {"print a cell", [&received](const std::vector<std::string>& args) {
        received = args;
        return 0;
    }};
    return table;
}

} // namespace

TEST_CASE("config arguments are stripped anywhere on the line", "[cli]")
{
    const char* argv[] = {"frlgrender", "map", "-c", "a.cfg", "cell", "-c=b.cfg", "3"};
    std::string configFile;

    auto positional = stripConfigArguments(7, const_cast<char**>(argv), configFile);

    REQUIRE(configFile == "b.cfg");
    REQUIRE(positional == std::vector<std::string>{"map", "cell", "3"});
}

TEST_CASE("commands dispatch on type and action", "[cli]")
{
    std::vector<std::string> received;
    CommandTable table = recordingTable(received);

    REQUIRE(prepareCommands(table, {"map", "cell", "1", "2"}) == 0);
    REQUIRE(received == std::vector<std::string>{"1", "2"});

    REQUIRE(prepareCommands(table, {}) == 1);
    REQUIRE(prepareCommands(table, {"tileset", "info"}) == 1);
    REQUIRE(prepareCommands(table, {"map"}) == 1);
    REQUIRE(prepareCommands(table, {"map", "render"}) == 1);
}

TEST_CASE("command failures become exit status 1", "[cli]")
{
    REQUIRE(runCommand("test", [] { return 0; }) == 0);
    REQUIRE(runCommand("test", []() -> int { throw FormatError("bad file"); }) == 1);
    REQUIRE(runCommand("test", []() -> int { throw std::runtime_error("other"); }) == 1);
}

TEST_CASE("numeric arguments are validated", "[cli]")
{
    REQUIRE(parseNumberArgument("42", "id") == 42);
    REQUIRE(parseNumberArgument("0", "id") == 0);
    REQUIRE_THROWS_AS(parseNumberArgument("", "id"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseNumberArgument("-1", "id"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseNumberArgument("12x", "id"), std::invalid_argument);
    REQUIRE_THROWS_AS(parseNumberArgument("99999999999", "id"), std::invalid_argument);
}
