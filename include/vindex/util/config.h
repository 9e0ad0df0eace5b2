// VINDEX - Configuration Parser
// Copyright (c) 2024 VINDEX Developers
// MIT License
//
// INI-style configuration for the ledger and the simulator.
//
// Format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally quoted: key="value with spaces"
// - Section headers: [section]
// - Bare keys are boolean flags; "nokey" sets key=false
//
// Command-line arguments use -key=value, or -section.key=value to target a
// section, and always override file values.

#ifndef VINDEX_UTIL_CONFIG_H
#define VINDEX_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace vindex {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }

    /// "source:line: message" for diagnostics
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @param overwrite If false, keys already set are left unchanged
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath, bool overwrite = false);

    /// Parse configuration text (sourceName appears in error messages)
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>",
                                  bool overwrite = false);

    /// Parse -key=value / -section.key=value arguments
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

    /// nullopt if missing or not an integer
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    /// nullopt if missing or not a number
    std::optional<double> TryGetDouble(const std::string& key,
                                       const std::string& section = "") const;
    double GetDouble(const std::string& key, double defaultValue,
                     const std::string& section = "") const;

    /// Accepts true/false, yes/no, on/off, 1/0
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Mutation and Inspection
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

private:
    static std::string MakeKey(const std::string& key, const std::string& section);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    static std::optional<bool> ParseBool(const std::string& str);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   bool overwrite, std::string& currentSection,
                   ConfigParseResult& result);

    void Store(ConfigEntry entry, bool overwrite);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace vindex

#endif // VINDEX_UTIL_CONFIG_H
