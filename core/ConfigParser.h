#pragma once

#include <map>
#include <string>

namespace FRLGRender {

// Reads "Key = Value" files. '#' and ';' start comment lines, surrounding quotes are stripped.
class ConfigParser {
public:
    ConfigParser() = default;

    bool loadFromFile(const std::string& filename);
    // Same grammar as loadFromFile; returns the number of lines that could not be parsed.
    int loadFromString(const std::string& contents);

    std::string get(const std::string& key, const std::string& defaultValue = "") const;
    bool getBool(const std::string& key, bool defaultValue) const;

    void set(const std::string& key, const std::string& value);
    bool hasKey(const std::string& key) const;

    const std::map<std::string, std::string>& getAllValues() const { return configValues; }

private:
    std::map<std::string, std::string> configValues;

    bool parseLine(const std::string& line);
    static std::string trim(const std::string& str);
};

} // namespace FRLGRender
