#include "ConfigParser.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "Logging/Logging.h"

namespace FRLGRender {

bool ConfigParser::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    int badLines = loadFromString(buffer.str());
    if (badLines > 0) {
        Log(WARNING, "Config", "{}: ignored {} malformed line(s)", filename, badLines);
    }
    return true;
}

int ConfigParser::loadFromString(const std::string& contents) {
    std::istringstream stream(contents);
    std::string line;
    int lineNumber = 0;
    int badLines = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        if (!parseLine(line)) {
            Log(DEBUG, "Config", "Line {} is not a key/value pair: '{}'", lineNumber, line);
            badLines++;
        }
    }
    return badLines;
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
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    Log(WARNING, "Config", "Value '{}' for {} is not a boolean, using default", it->second, key);
    return defaultValue;
}

void ConfigParser::set(const std::string& key, const std::string& value) {
    configValues[key] = value;
}

bool ConfigParser::hasKey(const std::string& key) const {
    return configValues.find(key) != configValues.end();
}

bool ConfigParser::parseLine(const std::string& line) {
    std::string trimmedLine = trim(line);

    if (trimmedLine.empty() || trimmedLine[0] == '#' || trimmedLine[0] == ';') {
        return true;
    }

    size_t equalsPos = trimmedLine.find('=');
    if (equalsPos == std::string::npos) {
        return false;
    }

    std::string key = trim(trimmedLine.substr(0, equalsPos));
    std::string value = trim(trimmedLine.substr(equalsPos + 1));

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

} // namespace FRLGRender
