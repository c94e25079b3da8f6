#ifndef SPLITPOLICY_CONFIG_HPP
#define SPLITPOLICY_CONFIG_HPP

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <splitpolicy/log.hpp>

namespace splitpolicy {

// Parses a spdlog level name ("trace", "debug", "info", "warn"/"warning",
// "err"/"error", "critical", "off"). Throws on anything else.
inline spdlog::level::level_enum parse_log_level(std::string_view name) {
    const std::string s{name};
    auto level = spdlog::level::from_str(s);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && s != "off")
        throw std::invalid_argument(
            fmt::format("splitpolicy: unknown log level '{}'", s));
    return level;
}

struct Config {
    spdlog::level::level_enum log_level{spdlog::level::warn};
    // Empty keeps the logger's current pattern.
    std::string log_pattern{};

    // Reads SPLITPOLICY_LOG_LEVEL and SPLITPOLICY_LOG_PATTERN; unset
    // variables keep the defaults.
    static Config from_env() {
        Config c;
        if (const char* level = std::getenv("SPLITPOLICY_LOG_LEVEL"))
            c.log_level = parse_log_level(level);
        if (const char* pattern = std::getenv("SPLITPOLICY_LOG_PATTERN"))
            c.log_pattern = pattern;
        return c;
    }
};

inline void configure(const Config& config) {
    auto& log = logger();
    log.set_level(config.log_level);
    if (!config.log_pattern.empty())
        log.set_pattern(config.log_pattern);
}

} // namespace splitpolicy

#endif // SPLITPOLICY_CONFIG_HPP
