#ifndef COMMAND_REGISTRY_H
#define COMMAND_REGISTRY_H

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <iostream>

namespace XcurScale {

struct Command
{
    std::string help;
    std::string usage;
    // argv[0] is the command name; options follow in getopt form
    std::function<int(int argc, char** argv)> handler;
};

using CommandTable = std::map<std::string, Command>;

// Function signature for plugin command registration
using CommandRegistrationFunction = void(*)(CommandTable&);

// Dispatch argv[0] to its command. Returns the handler's exit status.
inline int prepareCommands(CommandTable& commandTable, int argc, char** argv) {
    if (argc < 1) {
        return 1;
    }

    std::string name = argv[0];
    auto commandIt = commandTable.find(name);
    if (commandIt == commandTable.end()) {
        std::cerr << "Unknown command: " << name << std::endl;
        std::cerr << "Available commands:" << std::endl;
        for (const auto& cmd : commandTable) {
            std::cerr << "  " << cmd.first << " - " << cmd.second.help << std::endl;
        }
        return 1;
    }

    return commandIt->second.handler(argc, argv);
}

inline void printHelp(const CommandTable& commandTable, const char* programName) {
    std::cout << "Usage: " << programName << " <command> [options] <file>..." << std::endl;
    std::cout << "\nCommands:" << std::endl;
    for (const auto& cmd : commandTable) {
        std::cout << "  " << cmd.first << " - " << cmd.second.help << std::endl;
        std::cout << "      " << cmd.second.usage << std::endl;
    }
    std::cout << "\nCommon options:" << std::endl;
    std::cout << "  -c <config_file>  configuration file (xcurscale.cfg is used when present)" << std::endl;
    std::cout << "  -v                show debug output on the console" << std::endl;
    std::cout << "  -q                show nothing but errors on the console" << std::endl;
}

} // namespace XcurScale
#endif // COMMAND_REGISTRY_H
