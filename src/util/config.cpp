// DAOSTAKE - Configuration File Parser Implementation
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License

#include "daostake/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace daostake {
namespace util {

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "OK";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }

    char first = str.front();
    char last = str.back();

    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        std::string result = str.substr(1, str.length() - 2);

        // Escape sequences only apply inside double quotes
        if (first == '"') {
            std::string unescaped;
            unescaped.reserve(result.length());

            for (size_t i = 0; i < result.length(); ++i) {
                if (result[i] == '\\' && i + 1 < result.length()) {
                    char next = result[i + 1];
                    switch (next) {
                        case 'n': unescaped += '\n'; ++i; break;
                        case 't': unescaped += '\t'; ++i; break;
                        case '\\': unescaped += '\\'; ++i; break;
                        case '"': unescaped += '"'; ++i; break;
                        default: unescaped += result[i]; break;
                    }
                } else {
                    unescaped += result[i];
                }
            }
            return unescaped;
        }

        return result;
    }

    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }

    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());

    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length() && value[i + 1] == '{') {
            size_t end = value.find('}', i + 2);
            if (end != std::string::npos) {
                std::string varName = value.substr(i + 2, end - i - 2);
                const char* envValue = std::getenv(varName.c_str());
                if (envValue) {
                    result += envValue;
                }
                i = end + 1;
                continue;
            }
        }

        result += value[i];
        ++i;
    }

    return result;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

void ConfigManager::Store(ConfigEntry entry) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.fromCommandLine && !entry.fromCommandLine) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    // Section header [section]
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }

    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag, "nokey" negates
        std::string key = trimmed;
        bool negated = false;
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            negated = true;
        }
        entry.key = key;
        entry.value = negated ? "false" : "true";
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }

    if (entry.key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: " + entry.key, source, lineNum);
        return false;
    }

    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& sourceName) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();

    while (std::getline(stream, line)) {
        ++lineNum;

        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }

        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }

        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }

        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }

    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(filePath);

    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }

    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        while (!arg.empty() && arg[0] == '-') {
            arg = arg.substr(1);
        }
        if (arg.empty()) {
            continue;
        }

        ConfigEntry entry;
        entry.source = "<command-line>";
        entry.fromCommandLine = true;

        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                   std::islower(static_cast<unsigned char>(arg[2]))) {
            entry.key = arg.substr(2);
            entry.value = "false";
        } else {
            entry.key = arg;
            entry.value = "true";
        }

        // Dotted keys address a section: -emission.start_block=100, -pool.0.weight=3
        size_t dot = entry.key.rfind('.');
        if (dot != std::string::npos) {
            entry.section = entry.key.substr(0, dot);
            entry.key = entry.key.substr(dot + 1);
        }

        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            "<command-line>");
        }

        Store(std::move(entry));
    }

    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    for (char c : *str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    try {
        size_t pos = 0;
        uint64_t value = std::stoull(*str, &pos);
        if (pos != str->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                uint64_t defaultValue,
                                const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                            bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entries_[MakeKey(key, section)] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }

    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = entry;
}

// ============================================================================
// Sections
// ============================================================================

std::vector<std::string> ConfigManager::GetSections() const {
    std::set<std::string> sections;

    for (const auto& [key, entry] : entries_) {
        if (!entry.section.empty()) {
            sections.insert(entry.section);
        }
    }

    return std::vector<std::string>(sections.begin(), sections.end());
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;

    for (const auto& [fullKey, entry] : entries_) {
        if (entry.section == section) {
            keys.push_back(entry.key);
        }
    }

    return keys;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    std::string lastSection;
    bool first = true;

    for (const auto& [fullKey, entry] : entries_) {
        if (first || entry.section != lastSection) {
            if (!entry.section.empty()) {
                oss << "[" << entry.section << "]\n";
            }
            lastSection = entry.section;
            first = false;
        }
        oss << entry.key << "=" << entry.value << "\n";
    }

    return oss.str();
}

} // namespace util
} // namespace daostake
