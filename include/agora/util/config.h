// AGORA - Configuration File Parser
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Reads the INI-style files that carry DAO policy:
//
//   # or ; at the start of a line is a comment
//   loglevel = info          (keys before any header are global)
//   [dao]
//   quorum_rate = "50%"      (values may be single or double quoted)

#ifndef AGORA_UTIL_CONFIG_H
#define AGORA_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace agora {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/**
 * Outcome of parsing a config source. On failure, errorLine is the 1-based
 * line that was rejected (0 when the source could not be read at all).
 */
struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Failure(const std::string& message,
                                     const std::string& file, int line = 0) {
        return {false, message, file, line};
    }
};

/**
 * Section-scoped key/value settings. A key defined twice in the same
 * section keeps its last value. Parsing stops at the first bad line and
 * keeps whatever was read before it.
 */
class ConfigManager {
public:
    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Plain decimal digits only. nullopt if missing, signed, malformed or
    /// larger than 64 bits.
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

private:
    // (section, key); the global section is ""
    std::map<std::pair<std::string, std::string>, std::string> values_;
};

namespace ConfigKeys {
    // Global
    constexpr const char* LOGLEVEL = "loglevel";

    // DAO policy (read from a per-DAO section)
    constexpr const char* VOTING_DELAY = "voting_delay";
    constexpr const char* VOTING_PERIOD = "voting_period";
    constexpr const char* QUORUM_RATE = "quorum_rate";
    constexpr const char* MIN_ACTION_DELAY = "min_action_delay";
    constexpr const char* MIN_QUORUM_VOTES = "min_quorum_votes";
}

/**
 * Set the logger level from the global "loglevel" key. A missing key leaves
 * the level unchanged; an unrecognized level name is logged and ignored.
 *
 * @return false if the key is present but not a level name
 */
bool ApplyLogLevel(const ConfigManager& config);

} // namespace util
} // namespace agora

#endif // AGORA_UTIL_CONFIG_H
