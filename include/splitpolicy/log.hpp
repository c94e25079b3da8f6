#ifndef SPLITPOLICY_LOG_HPP
#define SPLITPOLICY_LOG_HPP

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace splitpolicy {

inline constexpr const char* logger_name = "splitpolicy";

// Library logger, created on first use. Reuses a logger already registered
// under the same name so an application can install its own sinks first.
inline spdlog::logger& logger() {
    static const auto instance = [] {
        if (auto existing = spdlog::get(logger_name))
            return existing;
        auto created = spdlog::stderr_color_mt(logger_name);
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return *instance;
}

} // namespace splitpolicy

#endif // SPLITPOLICY_LOG_HPP
