// AGORA - Configuration File Parser Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/util/config.h>
#include <agora/util/logging.h>

#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace agora {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first, str.find_last_not_of(whitespace) - first + 1);
}

std::string StripQuotes(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Failure("cannot open " + filePath, filePath);
    }
    if (static_cast<std::streamoff>(file.tellg()) > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Failure("file exceeds " + std::to_string(MAX_CONFIG_SIZE) +
                                          " bytes", filePath);
    }
    file.seekg(0);

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream in(content);
    std::string section;
    std::string raw;
    int lineNum = 0;

    while (std::getline(in, raw)) {
        ++lineNum;
        if (raw.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Failure("line too long", sourceName, lineNum);
        }

        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            if (line.back() != ']') {
                return ConfigParseResult::Failure("unterminated section header",
                                                  sourceName, lineNum);
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return ConfigParseResult::Failure("expected key = value", sourceName, lineNum);
        }
        std::string key = Trim(line.substr(0, eq));
        if (key.empty()) {
            return ConfigParseResult::Failure("empty key", sourceName, lineNum);
        }
        for (char c : key) {
            if (!IsKeyChar(c)) {
                return ConfigParseResult::Failure("invalid character '" + std::string(1, c) +
                                                  "' in key", sourceName, lineNum);
            }
        }

        values_[{section, key}] = StripQuotes(Trim(line.substr(eq + 1)));
    }

    return ConfigParseResult{};
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return values_.count({section, key}) > 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = values_.find({section, key});
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                  const std::string& section) const {
    auto text = TryGetString(key, section);
    if (!text || text->empty()) {
        return std::nullopt;
    }

    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : *text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (MAX - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

// ============================================================================
// Log Level
// ============================================================================

bool ApplyLogLevel(const ConfigManager& config) {
    auto name = config.TryGetString(ConfigKeys::LOGLEVEL);
    if (!name) {
        return true;
    }

    std::optional<LogLevel> level = LogLevelFromString(*name);
    if (!level) {
        LOG_WARN(LogCategory::CONFIG) << "Unknown log level '" << *name << "', ignored";
        return false;
    }

    Logger::Instance().SetLevel(*level);
    LOG_DEBUG(LogCategory::CONFIG) << "Log level set to " << LogLevelToString(*level);
    return true;
}

} // namespace util
} // namespace agora
