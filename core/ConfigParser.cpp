#include "ConfigParser.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace XcurScale {

bool ConfigParser::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    loadFromStream(file);
    return true;
}

void ConfigParser::loadFromStream(std::istream& in) {
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        lineNumber++;
        if (!parseLine(line)) {
            invalidLines.push_back(lineNumber);
        }
    }
}

std::string ConfigParser::get(const std::string& key, const std::string& defaultValue) const {
    auto it = configValues.find(key);
    if (it != configValues.end()) {
        return it->second;
    }
    return defaultValue;
}

bool ConfigParser::getBool(const std::string& key, bool defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end()) {
        return defaultValue;
    }

    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return defaultValue;
}

long ConfigParser::getInt(const std::string& key, long defaultValue) const {
    auto it = configValues.find(key);
    if (it == configValues.end() || it->second.empty()) {
        return defaultValue;
    }

    const char* begin = it->second.c_str();
    char* end = nullptr;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0') {
        return defaultValue;
    }
    return value;
}

void ConfigParser::set(const std::string& key, const std::string& value) {
    configValues[key] = value;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return configValues.find(key) != configValues.end();
}

bool ConfigParser::parseLine(const std::string& line) {
    std::string trimmedLine = trim(line);

    // Skip empty lines and comments
    if (trimmedLine.empty() || trimmedLine[0] == '#' || trimmedLine[0] == ';') {
        return true;
    }

    // Find the equals sign
    size_t equalsPos = trimmedLine.find('=');
    if (equalsPos == std::string::npos) {
        return false; // Invalid line format
    }

    // Extract key and value
    std::string key = trim(trimmedLine.substr(0, equalsPos));
    std::string value = trim(trimmedLine.substr(equalsPos + 1));

    // Remove quotes if present
    if (value.length() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.length() - 2);
    }

    if (key.empty()) {
        return false;
    }

    configValues[key] = value;
    return true;
}

std::string ConfigParser::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace XcurScale
