#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

using Logger = spdlog::logger;

// Creates a logger writing to the shared console sink, at the current default level.
Logger logger_for(std::string name);

// Sets the level used by the default logger and any logger subsequently created by logger_for.
// Call this before creating Loggers (e.g. in main()).
void set_log_level(spdlog::level::level_enum level);

// Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);
