#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/CFG.h"
#include "core/CommandRegistry.h"
#include "core/Logging/FileLogWriter.h"
#include "core/Logging/Logging.h"
#include "formats/LAYOUT/LayoutTable.h"
#include "render/Compositor.h"
#include "render/Tileset.h"

using namespace FRLGRender;

static void registerAllCommands(CommandTable& commandTable) {
    LayoutTable::registerCommands(commandTable);
    Tileset::registerCommands(commandTable);
    Compositor::registerCommands(commandTable);
}

int main(int argc, char **argv) {
    std::string configFile;
    std::vector<std::string> positional = stripConfigArguments(argc, argv, configFile);

    // Auto-detect config file if not specified
    if (configFile.empty()) {
        configFile = CFG::findConfigFile();
    }

    CommandTable commandTable;
    registerAllCommands(commandTable);

    // Show help if no command specified
    if (positional.empty()) {
        printHelp(commandTable, argv[0]);
        return 0;
    }

    // Console only until the config names a level and a log file
    InitializeLogging(WARNING);
    FRLG_CFG.initialize(configFile);
    SetConsoleWindowLogLevel(FRLG_CFG.ConsoleLogLevel);
    if (!FRLG_CFG.LogFile.empty()) {
        AddLogWriter(std::make_shared<FileLogWriter>(FRLG_CFG.LogFile, DEBUG));
    }
    ToggleLogging(FRLG_CFG.Logging);
    Log(MESSAGE, "Core", "FRLG renderer using RootPath: {}", FRLG_CFG.RootPath);

    int result = prepareCommands(commandTable, positional);

    ShutdownLogging();
    return result;
}
