#include "config.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::error("Config") << "Failed to open config file: " << filepath;
        return false;
    }

    std::string currentSection;
    std::string line;
    while (std::getline(file, line)) {
        parseLine(line, currentSection);
    }
    return true;
}

void Config::loadFromString(const std::string& text) {
    std::istringstream stream(text);
    std::string currentSection;
    std::string line;
    while (std::getline(stream, line)) {
        parseLine(line, currentSection);
    }
}

void Config::parseLine(const std::string& rawLine, std::string& currentSection) {
    std::string line = trim(rawLine);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    // Check for section header [Section]
    if (line[0] == '[' && line[line.length() - 1] == ']') {
        currentSection = trim(line.substr(1, line.length() - 2));
        return;
    }

    // Parse key = value
    size_t equalPos = line.find('=');
    if (equalPos == std::string::npos) {
        Logger::warning("Config") << "Ignoring malformed line: " << line;
        return;
    }

    std::string key = trim(line.substr(0, equalPos));
    std::string value = trim(line.substr(equalPos + 1));

    // Remove inline comments
    size_t commentPos = value.find_first_of("#;");
    if (commentPos != std::string::npos) {
        value = trim(value.substr(0, commentPos));
    }

    if (!currentSection.empty() && !key.empty()) {
        m_data[currentSection][key] = value;
    }
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    return (keyIt != sectionIt->second.end()) ? &keyIt->second : nullptr;
}

bool Config::hasKey(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

int Config::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }
    try {
        return std::stoi(*value);
    } catch (const std::logic_error&) {
        Logger::warning("Config") << "Failed to parse int for [" << section << "]:" << key;
    }
    return defaultValue;
}

float Config::getFloat(const std::string& section, const std::string& key, float defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }
    try {
        return std::stof(*value);
    } catch (const std::logic_error&) {
        Logger::warning("Config") << "Failed to parse float for [" << section << "]:" << key;
    }
    return defaultValue;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    const std::string text = toLower(*value);
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    Logger::warning("Config") << "Failed to parse bool for [" << section << "]:" << key;
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(section, key);
    return value ? *value : defaultValue;
}

bool Config::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error("Config") << "Failed to open config file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }
    return true;
}

void Config::setInt(const std::string& section, const std::string& key, int value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setFloat(const std::string& section, const std::string& key, float value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "1" : "0";
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}
