#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

#include "Fixtures.h"
#include "core/Logging/Logging.h"

using namespace FRLGRender;
using namespace FRLGRender::test;

TEST_CASE("log messages reach the file writer until logging is toggled off", "[logging]")
{
    TempDir dir;
    // Nothing is written before initialisation
    Log(ERROR, "Test", "dropped {}", 1);

    InitializeLogging(FATAL, dir.file("test.log"));
    Log(WARNING, "Test", "tile {} skipped", 42);
    Log(DEBUG, "Test", "palette {}", "00.pal");
    ToggleLogging(false);
    Log(ERROR, "Test", "muted");
    ToggleLogging(true);
    ShutdownLogging();

    std::ifstream in(dir.file("test.log"));
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();

    REQUIRE(text.find("=== frlgrender log started ===") != std::string::npos);
    REQUIRE(text.find("[WARNING][Test] tile 42 skipped") != std::string::npos);
    REQUIRE(text.find("[DEBUG][Test] palette 00.pal") != std::string::npos);
    REQUIRE(text.find("muted") == std::string::npos);
    REQUIRE(text.find("dropped") == std::string::npos);
    REQUIRE(text.find("=== frlgrender log ended ===") != std::string::npos);
    REQUIRE_FALSE(IsLoggingEnabled());
}

TEST_CASE("flushing keeps messages in the order they were logged", "[logging]")
{
    TempDir dir;
    InitializeLogging(FATAL, dir.file("order.log"));
    for (int i = 0; i < 2000; ++i) {
        Log(MESSAGE, "Order", "line {}", i);
        if (i % 7 == 0) {
            FlushLogs();
        }
    }
    ShutdownLogging();

    std::ifstream in(dir.file("order.log"));
    std::string line;
    int expected = 0;
    while (std::getline(in, line)) {
        auto pos = line.find("[Order] line ");
        if (pos == std::string::npos) {
            continue;
        }
        REQUIRE(std::stoi(line.substr(pos + 13)) == expected);
        ++expected;
    }
    REQUIRE(expected == 2000);
}
