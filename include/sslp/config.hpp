#ifndef SSLP_CONFIG_HPP
#define SSLP_CONFIG_HPP

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace sslp {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

LogLevel parse_log_level(std::string_view name);
const char* log_level_name(LogLevel level);

class MatcherConfig {
public:
    LogLevel log_level = LogLevel::Info;

    // false: a contribution the reservoir cannot fully cover is rejected
    bool allow_partial_match = true;

    // Smallest amount fund() accepts
    I128 min_fund_amount = 1;

    MatcherConfig() = default;

    // Load from TOML file
    static MatcherConfig from_file(std::string_view path);

    // Load from TOML string
    static MatcherConfig from_toml(std::string_view content);

    // Builder methods
    MatcherConfig& set_log_level(LogLevel level) {
        log_level = level;
        return *this;
    }

    MatcherConfig& enable_partial_match(bool enabled = true) {
        allow_partial_match = enabled;
        return *this;
    }

    MatcherConfig& set_min_fund_amount(I128 amount) {
        if (amount < 1) {
            throw ConfigError("min_fund_amount must be at least 1");
        }
        min_fund_amount = amount;
        return *this;
    }
};

} // namespace sslp

#endif // SSLP_CONFIG_HPP
