#include "CFG.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <vector>

#include "ConfigParser.h"
#include "Logging/Logging.h"

namespace FRLGRender {

CFG::CFG()
    : RootPath(defaultRootPath()), LayoutsFile("data/layouts/layouts.json"),
      DefaultLayout("LAYOUT_POWER_PLANT"), OutputPath("/tmp/render.png"),
      Logging(true), LogFile("frlgrender.log"), ConsoleLogLevel(WARNING) {}

void CFG::initialize(const std::string& configFile) {
    ConfigParser config;

    if (configFile.empty()) {
        Log(WARNING, "Config", "No config file, using defaults (RootPath '{}')", RootPath);
        return;
    }

    if (!config.loadFromFile(configFile)) {
        Log(WARNING, "Config", "Could not load config file: {}, using defaults", configFile);
        return;
    }

    apply(config);
    Log(DEBUG, "Config", "Loaded {} key(s) from {}", config.getAllValues().size(), configFile);
}

void CFG::apply(const ConfigParser& config) {
    RootPath = config.get("RootPath", RootPath);
    LayoutsFile = config.get("LayoutsFile", LayoutsFile);
    DefaultLayout = config.get("DefaultLayout", DefaultLayout);
    OutputPath = config.get("OutputPath", OutputPath);
    Logging = config.getBool("Logging", Logging);
    LogFile = config.get("LogFile", LogFile);

    if (config.hasKey("ConsoleLogLevel")) {
        auto levelStr = config.get("ConsoleLogLevel");
        LogLevel parsed = ParseLogLevel(levelStr, count);
        if (parsed == count) {
            Log(WARNING, "Config", "Unknown ConsoleLogLevel '{}', keeping {}", levelStr, LogLevelName(ConsoleLogLevel));
        } else {
            ConsoleLogLevel = parsed;
        }
    }

    if (RootPath.empty()) {
        Log(WARNING, "Config", "RootPath is not set; layout commands need it");
    }
}

std::string CFG::getLayoutsFilePath() const {
    std::filesystem::path layouts(LayoutsFile);
    if (layouts.is_absolute() || RootPath.empty()) {
        return layouts.string();
    }
    return (std::filesystem::path(RootPath) / layouts).string();
}

std::string CFG::defaultRootPath() {
    const char* root = std::getenv("PRET_ROOT");
    return root ? std::string(root) : std::string();
}

// Helper function to auto-detect config file
std::string CFG::findConfigFile() {
    std::vector<std::string> configFiles;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(".", ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".cfg") {
            configFiles.push_back(it->path().string());
        }
    }
    if (ec) {
        Log(WARNING, "Config", "Error scanning for config files: {}", ec.message());
    }
    if (configFiles.empty()) {
        return "";
    }
    std::sort(configFiles.begin(), configFiles.end());
    return configFiles[0];
}

// Define the global variable
CFG FRLG_CFG;

} // namespace FRLGRender
