// MATEICO - Configuration File Parser
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Parses INI-style configuration for the ledger tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, 1/0
// - A bare key is a boolean flag; "nokey" negates it

#ifndef MATEICO_UTIL_CONFIG_H
#define MATEICO_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mateico {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name (under $HOME)
constexpr const char* DEFAULT_DATADIR_NAME = ".mateico";

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "mateico.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Source tag of entries set on the command line
constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

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
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing configuration input.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Manages configuration from files and command-line arguments.
 *
 * Priority order (highest to lowest):
 * 1. Command-line arguments
 * 2. Data directory config file (<datadir>/mateico.conf or -conf)
 * 3. Built-in defaults
 *
 * Entries that came from the command line are never replaced by a file,
 * so the command line may be parsed first (it names the data directory).
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse command-line arguments of the form -key=value, --key=value,
     * -flag and -noflag. Anything not starting with '-' is returned as a
     * positional argument, in order.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);

    /**
     * Load the data directory config file. Uses -conf when given,
     * otherwise <datadir>/mateico.conf. A missing default file is not
     * an error; a missing explicit -conf file is.
     */
    ConfigParseResult LoadConfigFile();

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (returns nullopt if key doesn't exist or is invalid)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Get list of values (comma-separated or repeated entries)
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Get path value (with ~ expansion)
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than files and command line)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Validation and Utilities
    // ========================================================================

    /// Register an allowed key (for validation)
    void AllowKey(const std::string& key);

    /// Warnings for keys that were set but never registered with AllowKey
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    /// -datadir if given, else the default data directory
    std::string GetDataDir() const;

    /// $HOME/.mateico
    static std::string GetDefaultDataDir();

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

    /// Parse boolean string (true/false, yes/no, on/off, 1/0)
    static std::optional<bool> ParseBool(const std::string& str);

    /// Dump all configuration to string ("key=value" lines)
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source, int lineNum);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;  // Repeated entries
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Common Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* TOKENNAME = "tokenname";
    constexpr const char* TOKENSYMBOL = "tokensymbol";
    constexpr const char* CALLER = "caller";
    constexpr const char* TIME = "time";
}

} // namespace util
} // namespace mateico

#endif // MATEICO_UTIL_CONFIG_H
