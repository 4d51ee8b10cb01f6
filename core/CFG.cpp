#include "CFG.h"

#include <filesystem>
#include <format>
#include <thread>

#include "ConfigParser.h"
#include "plugins/XCUR/XCURV1.hpp"

namespace XcurScale {

CFG::CFG() {
    resetToDefaults();
}

void CFG::resetToDefaults() {
    configFilePath.clear();
    ScaleFactor = 0; // unset until the config file or -s provides one
    IgnoreUnrecognized = false;
    ScaleNominalSize = false;
    Jobs = 1;
    Logging = true;
    LogFile = "xcurscale.log";
    ConsoleLogLevel = "WARNING";
    loadWarnings.clear();
}

bool CFG::initialize(const std::string& configFile) {
    configFilePath = configFile;
    ConfigParser config;

    if (!config.loadFromFile(configFile)) {
        // If config file doesn't exist or can't be loaded, use defaults
        loadWarnings.push_back(std::format("Could not load config file: {}, using defaults", configFile));
        return false;
    }

    for (int line : config.getInvalidLines()) {
        loadWarnings.push_back(std::format("{}:{}: expected key = value, line ignored", configFile, line));
    }

    apply(config);
    return true;
}

void CFG::apply(const ConfigParser& config) {
    if (config.hasKey("ScaleFactor")) {
        long factor = config.getInt("ScaleFactor", 0);
        if (factor < 1 || factor > static_cast<long>(XCURSOR_IMAGE_MAX_SIZE)) {
            loadWarnings.push_back(std::format("Invalid ScaleFactor '{}', ignored", config.get("ScaleFactor")));
        } else {
            ScaleFactor = static_cast<uint32_t>(factor);
        }
    }

    IgnoreUnrecognized = config.getBool("IgnoreUnrecognized", IgnoreUnrecognized);
    ScaleNominalSize = config.getBool("ScaleNominalSize", ScaleNominalSize);

    long jobs = config.getInt("Jobs", Jobs);
    if (jobs < 0) {
        loadWarnings.push_back(std::format("Invalid Jobs '{}', keeping {}", config.get("Jobs"), Jobs));
    } else {
        Jobs = static_cast<int>(jobs);
    }

    Logging = config.getBool("Logging", Logging);
    LogFile = config.get("LogFile", LogFile);
    ConsoleLogLevel = config.get("ConsoleLogLevel", ConsoleLogLevel);
}

bool CFG::isScaleFactorValid() const {
    return ScaleFactor >= 1 && ScaleFactor <= XCURSOR_IMAGE_MAX_SIZE;
}

unsigned int CFG::effectiveJobs() const {
    if (Jobs > 0) {
        return static_cast<unsigned int>(Jobs);
    }
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

// Helper function to auto-detect config file
std::string CFG::findConfigFile() {
    std::error_code ec;
    if (std::filesystem::is_regular_file("xcurscale.cfg", ec)) {
        return "xcurscale.cfg";
    }
    return "";
}

// Define the global variable
CFG XCS_CFG;

} // namespace XcurScale
