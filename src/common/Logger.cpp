#include "Logger.hpp"

#include "string_utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::sinks::sink> console_sink;
}

Logger logger_for(std::string name) {
    if (!console_sink)
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = spdlog::logger(std::move(name), console_sink);
    logger.set_level(spdlog::default_logger()->level());
    return logger;
}

void set_log_level(spdlog::level::level_enum level) { spdlog::set_level(level); }

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    const auto lowered = lower_case(name);
    // spdlog maps anything it doesn't recognise to "off", so only trust that answer when asked for it.
    const auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off && lowered != "off")
        return std::nullopt;
    return level;
}
