/**
 * @file config.h
 * @brief INI-style configuration ([Section], key = value, # or ; comments)
 */

#pragma once
#include <string>
#include <map>

class Config {
public:
    Config() = default;

    bool loadFromFile(const std::string& filepath);

    /// Parses INI text, merging into the current values
    void loadFromString(const std::string& text);

    bool saveToFile(const std::string& filepath) const;

    bool hasKey(const std::string& section, const std::string& key) const;

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    float getFloat(const std::string& section, const std::string& key, float defaultValue = 0.0f) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& section, const std::string& key, int value);
    void setFloat(const std::string& section, const std::string& key, float value);
    void setBool(const std::string& section, const std::string& key, bool value);
    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    const std::string* find(const std::string& section, const std::string& key) const;
    void parseLine(const std::string& rawLine, std::string& currentSection);

    std::map<std::string, std::map<std::string, std::string>> m_data;
};
