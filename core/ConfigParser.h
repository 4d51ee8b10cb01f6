#pragma once

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace XcurScale {

// Reads `key = value` files. Blank lines and lines starting with # or ;
// are ignored; values may be wrapped in single or double quotes.
class ConfigParser {
private:
    std::map<std::string, std::string> configValues;
    std::vector<int> invalidLines;

public:
    ConfigParser() = default;

    // Load config from file
    bool loadFromFile(const std::string& filename);

    // Load config from any stream (used for files and tests alike)
    void loadFromStream(std::istream& in);

    // Get a config value with default
    std::string get(const std::string& key, const std::string& defaultValue = "") const;

    // "1", "true", "yes", "on" are true; "0", "false", "no", "off" false
    bool getBool(const std::string& key, bool defaultValue) const;

    // Non-numeric values fall back to the default
    long getInt(const std::string& key, long defaultValue) const;

    // Set a config value
    void set(const std::string& key, const std::string& value);

    // Check if a key exists
    bool hasKey(const std::string& key) const;

    // Line numbers (1-based) that were neither comments nor key = value
    const std::vector<int>& getInvalidLines() const { return invalidLines; }

    // Get all config values
    const std::map<std::string, std::string>& getAllValues() const { return configValues; }

private:
    // Parse a single line
    bool parseLine(const std::string& line);

    // Trim whitespace
    static std::string trim(const std::string& str);
};

} // namespace XcurScale
