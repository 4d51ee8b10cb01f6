#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "core/CFG.h"
#include "core/Logging/Logging.h"
#include "plugins/CommandRegistry.h"
#include "plugins/XCUR/XCUR.h"

using namespace XcurScale;

int main(int argc, char **argv) {
    std::string configFile;
    bool verbose = false;
    bool quiet = false;

    // Manual scan for the common options anywhere; everything else goes to
    // the command
    std::vector<char*> commandArgs;
    for (int i = 1; i < argc; ++i) {
        std::string_view a = argv[i];
        if (a == "-c" && i + 1 < argc) {
            configFile = argv[i + 1];
            ++i;
            continue;
        }
        if (a.rfind("-c=", 0) == 0 && a.size() > 3) {
            configFile = std::string(a.substr(3));
            continue;
        }
        if (a == "-v" || a == "--verbose") {
            verbose = true;
            continue;
        }
        if (a == "-q" || a == "--quiet") {
            quiet = true;
            continue;
        }
        commandArgs.push_back(argv[i]);
    }

    // Initialize command registry for help or execution
    CommandTable commandTable;
    XCUR::registerCommands(commandTable);

    // Show help if no command specified
    if (commandArgs.empty() || std::string_view(commandArgs[0]) == "help" ||
        std::string_view(commandArgs[0]) == "--help" || std::string_view(commandArgs[0]) == "-h") {
        printHelp(commandTable, argv[0]);
        return 0;
    }

    // Auto-detect config file if not specified; running without one is fine
    if (configFile.empty()) {
        configFile = CFG::findConfigFile();
    }
    if (!configFile.empty()) {
        XCS_CFG.initialize(configFile);
    }

    LogLevel consoleLevel = LogLevelFromString(XCS_CFG.ConsoleLogLevel, WARNING);
    if (verbose) {
        consoleLevel = DEBUG;
    } else if (quiet) {
        consoleLevel = ERROR;
    }
    InitializeLogging(consoleLevel, XCS_CFG.Logging ? XCS_CFG.LogFile : std::string());
    ToggleLogging(XCS_CFG.Logging);

    for (const auto& warning : XCS_CFG.loadWarnings) {
        Log(WARNING, "Core", "{}", warning);
    }
    if (!configFile.empty()) {
        Log(DEBUG, "Core", "Using config file {}", configFile);
    }

    int result = prepareCommands(commandTable, static_cast<int>(commandArgs.size()), commandArgs.data());

    // Shutdown our logging system
    ShutdownLogging();
    return result;
}
