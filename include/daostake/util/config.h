// DAOSTAKE - Configuration File Parser
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// Parses INI-style configuration files for the staking engine and simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef DAOSTAKE_UTIL_CONFIG_H
#define DAOSTAKE_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace daostake {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "daostake.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false}; // True if this is a default value
    bool fromCommandLine{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }

    /// "file:line: message" form for diagnostics
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Command-line values always win over file values; within files the
 * last definition of a key wins.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse -key=value / --key value / -flag / -noflag arguments.
    /// Non-option arguments are collected in GetPositional().
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get unsigned integer value (nullopt if missing, negative or malformed)
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than config files)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Get all section names
    std::vector<std::string> GetSections() const;

    /// Get all keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Arguments that were not options
    const std::vector<std::string>& GetPositional() const { return positional_; }

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Dump all configuration to string
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    ConfigParseResult ParseStream(std::istream& stream, const std::string& sourceName);

    void Store(ConfigEntry entry);

    static std::string Trim(const std::string& str);

    static std::string Unquote(const std::string& str);

    static std::optional<bool> ParseBool(const std::string& str);

    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* CONF = "conf";
    constexpr const char* SCRIPT = "script";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* PREMINT = "premint";

    // [emission]
    constexpr const char* SECTION_EMISSION = "emission";
    constexpr const char* START_BLOCK = "start_block";
    constexpr const char* PERIOD_LENGTH = "period_length";
    constexpr const char* PERIOD_COUNT = "period_count";
    constexpr const char* BASE_RATE = "base_rate";
    constexpr const char* DECAY_NUMERATOR = "decay_numerator";
    constexpr const char* DECAY_DENOMINATOR = "decay_denominator";

    // [wallets]
    constexpr const char* SECTION_WALLETS = "wallets";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* COMMUNITY = "community";
    constexpr const char* ADMIN = "admin";

    // [pool.N]
    constexpr const char* SECTION_POOL_PREFIX = "pool.";
    constexpr const char* LP_TOKEN = "lp_token";
    constexpr const char* WEIGHT = "weight";
}

} // namespace util
} // namespace daostake

#endif // DAOSTAKE_UTIL_CONFIG_H
