#ifndef COMMAND_REGISTRY_H
#define COMMAND_REGISTRY_H

#include <cctype>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/Logging/Logging.h"

namespace FRLGRender {

struct Action
{
    std::string help;
    std::function<int(const std::vector<std::string>& args)> handler;
};

struct Command
{
    std::string help;
    std::map<std::string, Action> actions;
};

using CommandTable = std::map<std::string, Command>;

// Runs a command body, turning any escaping exception into a logged failure and exit status 1.
inline int runCommand(const char* owner, const std::function<int()>& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        Log(ERROR, owner, "{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

inline unsigned long parseNumberArgument(const std::string& arg, const char* what) {
    if (arg.empty() || arg.size() > 9 || !std::isdigit(static_cast<unsigned char>(arg[0]))) {
        throw std::invalid_argument(std::string("Expected a number for ") + what + ", got '" + arg + "'");
    }
    size_t consumed = 0;
    unsigned long value = std::stoul(arg, &consumed);
    if (consumed != arg.size()) {
        throw std::invalid_argument(std::string("Expected a number for ") + what + ", got '" + arg + "'");
    }
    return value;
}

// Argument vector with "-c <file>" / "-c=<file>" taken out.
inline std::vector<std::string> stripConfigArguments(int argc, char** argv, std::string& configFile) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" && i + 1 < argc) {
            configFile = argv[++i];
            continue;
        }
        if (arg.rfind("-c=", 0) == 0 && arg.size() > 3) {
            configFile = arg.substr(3);
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}

// positional = <type> <action> [args...]
inline int prepareCommands(const CommandTable& commandTable, const std::vector<std::string>& positional) {
    if (positional.empty()) {
        std::cerr << "No command given" << std::endl;
        return 1;
    }
    const std::string& type = positional[0];
    std::string action = positional.size() > 1 ? positional[1] : "";

    auto commandIt = commandTable.find(type);
    if (commandIt == commandTable.end()) {
        std::cerr << "Unknown command type: " << type << std::endl;
        std::cerr << "Available commands:" << std::endl;
        for (const auto& cmd : commandTable) {
            std::cerr << "  " << cmd.first << " - " << cmd.second.help << std::endl;
        }
        return 1;
    }

    auto actionIt = commandIt->second.actions.find(action);
    if (actionIt == commandIt->second.actions.end()) {
        std::cerr << "Unknown action: " << action << " for command: " << type << std::endl;
        std::cerr << "Available actions for " << type << ":" << std::endl;
        for (const auto& act : commandIt->second.actions) {
            std::cerr << "  " << act.first << " - " << act.second.help << std::endl;
        }
        return 1;
    }

    std::vector<std::string> args(positional.begin() + 2, positional.end());
    return actionIt->second.handler(args);
}

inline void printHelp(const CommandTable& commandTable, const char* programName) {
    std::cout << "Usage: " << programName << " <type> <action> [args...] [-c config_file]" << std::endl;
    std::cout << "\nTypes:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << "  " << cmd.first << " - " << cmd.second.help << std::endl;
    }
    std::cout << "\nActions:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << cmd.first << " actions:" << std::endl;
        for (const auto& act : cmd.second.actions) {
            std::cout << "  " << act.first << " - " << act.second.help << std::endl;
        }
        std::cout << std::endl;
    }
    std::cout << "Optional:\n  -c <config_file> - renderer configuration (first *.cfg in the working directory if not specified)" << std::endl;
}

} // namespace FRLGRender

#endif // COMMAND_REGISTRY_H
