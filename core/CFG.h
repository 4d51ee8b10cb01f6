#ifndef CFG_H
#define CFG_H

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace XcurScale {

class ConfigParser;

class CFG {
    public:
    std::string configFilePath;

    uint32_t ScaleFactor;
    bool IgnoreUnrecognized;
    bool ScaleNominalSize;
    int Jobs;
    bool Logging;
    std::string LogFile;
    std::string ConsoleLogLevel;

    // Problems found while reading the config file. Logging is configured
    // from this object, so they are kept here and logged afterwards.
    std::vector<std::string> loadWarnings;

    CFG();

    // Reads configFile when it exists; a missing file keeps the defaults
    bool initialize(const std::string& configFile);
    void apply(const ConfigParser& config);
    void resetToDefaults();

    bool isScaleFactorValid() const;
    // Jobs resolved against the machine: 0 means one per hardware thread
    unsigned int effectiveJobs() const;

    static std::string findConfigFile();

private:
    CFG(const CFG&) = delete;
    CFG& operator=(const CFG&) = delete;
};

// Global variable declaration always use this
extern CFG XCS_CFG;

} // namespace XcurScale

#endif // CFG_H
