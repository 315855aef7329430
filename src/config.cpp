// Single-sided matcher configuration - TOML loading

#include "sslp/config.hpp"
#include <fstream>
#include <sstream>

namespace sslp {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Invalid boolean for " + key + ": " + value);
}

I128 parse_amount(const std::string& key, const std::string& value) {
    if (value.empty()) {
        throw ConfigError("Empty value for " + key);
    }

    I128 result = 0;
    for (char c : value) {
        if (c == '_') continue;
        if (c < '0' || c > '9') {
            throw ConfigError("Invalid integer for " + key + ": " + value);
        }
        const int digit = c - '0';
        if (result > (I128_MAX - digit) / 10) {
            throw ConfigError("Integer out of range for " + key + ": " + value);
        }
        result = result * 10 + digit;
    }
    return result;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    throw ConfigError("Unknown log level: " + std::string(name));
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
    }
    return "info";
}

MatcherConfig MatcherConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

MatcherConfig MatcherConfig::from_toml(std::string_view content) {
    MatcherConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.log_level = parse_log_level(value);
        }
        else if (current_section == "matching") {
            if (key == "allow_partial_match") {
                config.allow_partial_match = parse_bool(key, value);
            } else if (key == "min_fund_amount") {
                config.set_min_fund_amount(parse_amount(key, value));
            }
        }
        else if (current_section == "defund") {
            if (key == "require_unmatched_liquidity" && !parse_bool(key, value)) {
                throw ConfigError("require_unmatched_liquidity cannot be disabled");
            }
        }
    }

    return config;
}

}  // namespace sslp
