// PAMTALK - Configuration File Parser
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Parses INI-style configuration for the exchange engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally under a [section] header
// - Values can be quoted: memo="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef PAMTALK_UTIL_CONFIG_H
#define PAMTALK_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pamtalk {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or source name
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return ConfigParseResult{};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        ConfigParseResult result;
        result.success = false;
        result.errorMessage = msg;
        result.errorFile = file;
        result.errorLine = line;
        return result;
    }

    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds parsed configuration values keyed by (section, key).
 *
 * Later definitions of the same key overwrite earlier ones. Values set
 * with SetDefault() never overwrite an existing entry.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text (sourceName is used in error messages)
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Typed Access
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue = "",
                          const std::string& section = "") const;

    /// Integer values must be fully numeric
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue = 0,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue = 0,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue = false,
                 const std::string& section = "") const;

    // ========================================================================
    // Mutation
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Introspection and Validation
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Mark a key as required; Validate() reports it when missing
    void RequireKey(const std::string& key, const std::string& section = "");

    /// Returns one message per problem, empty when valid
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return entries_.size(); }

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static std::string ExpandEnvVars(const std::string& value);

private:
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;

    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source,
                   int lineNum, std::string& currentSection,
                   ConfigParseResult& result);
};

// ============================================================================
// Well-Known Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Global section
    constexpr const char* ADMIN = "admin";
    constexpr const char* COMMITTEE_KEY = "committee_key";
    constexpr const char* ESCROW_HOLDING = "escrow_holding";

    // Sections
    constexpr const char* GOVERNANCE_SECTION = "governance";
    constexpr const char* REWARD_SECTION = "reward";
    constexpr const char* SETTLEMENT_SECTION = "settlement";
    constexpr const char* LOG_SECTION = "log";

    // Section keys
    constexpr const char* REQUIRED_APPROVALS = "required_approvals";
    constexpr const char* PROPOSAL_LIFETIME = "proposal_lifetime";
    constexpr const char* REWARD_RATE = "reward_rate";
    constexpr const char* FEE_RATE_BPS = "fee_rate_bps";
    constexpr const char* LOG_LEVEL = "level";
}

} // namespace util
} // namespace pamtalk

#endif // PAMTALK_UTIL_CONFIG_H
