#pragma once

/// @file logging.hpp
/// @brief Shared spdlog logger for the engine, the I/O layer and the CLI

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace medassign::utils {

inline constexpr const char* LOGGER_NAME = "medassign";

/// Named logger writing to stderr; created on first use
inline std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

/// Map a configuration level name onto an spdlog level
[[nodiscard]] inline std::optional<spdlog::level::level_enum>
parse_log_level(std::string_view name) noexcept {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "critical")
        return spdlog::level::critical;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

/// Set the level of the shared logger; returns false for an unknown level name
inline bool set_log_level(std::string_view name) {
    const auto level = parse_log_level(name);
    if (!level) {
        logger()->warn("Unknown log level '{}', keeping {}", name,
                       spdlog::level::to_string_view(logger()->level()));
        return false;
    }
    logger()->set_level(*level);
    return true;
}

} // namespace medassign::utils
