#ifndef CFG_H
#define CFG_H

#pragma once

#include <string>

#include "Logging/Logging.h"

namespace FRLGRender {

class ConfigParser;

class CFG {
    public:

    // Root of the decompilation checkout; tileset, map and layout paths hang off it.
    std::string RootPath;
    std::string LayoutsFile;
    std::string DefaultLayout;
    std::string OutputPath;
    bool Logging;
    std::string LogFile;
    LogLevel ConsoleLogLevel;

    CFG();

    // Empty configFile keeps the defaults.
    void initialize(const std::string& configFile);
    void apply(const ConfigParser& config);

    const std::string& getRootPath() const { return RootPath; }
    // LayoutsFile resolved against RootPath unless it is already absolute.
    std::string getLayoutsFilePath() const;
    static std::string findConfigFile();

private:
    CFG(const CFG&) = delete;
    CFG& operator=(const CFG&) = delete;

    static std::string defaultRootPath();
};

// Global variable declaration always use this
extern CFG FRLG_CFG;

} // namespace FRLGRender

#endif // CFG_H
