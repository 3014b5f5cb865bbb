#include "Configuration.hpp"
#include "Logger.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

Configuration::Configuration() {
    attribute_server_ = string_env(OTITEMS_ATTRIBUTE_SERVER_ENV, DefaultAttributeServer);
    const auto level_name = string_env(OTITEMS_LOG_LEVEL_ENV, "info");
    if (auto level = parse_log_level(level_name)) {
        log_level_ = *level;
    } else {
        throw std::invalid_argument(
            fmt::format("An environment variable called {} must name a log level, not '{}'", OTITEMS_LOG_LEVEL_ENV,
                        level_name));
    }
    sprite_cache_size_ = static_cast<size_t>(
        std::max(1, int_env(OTITEMS_SPRITE_CACHE_SIZE_ENV, static_cast<int>(DefaultSpriteCacheSize))));
}

std::string Configuration::attribute_server() const { return attribute_server_; }
spdlog::level::level_enum Configuration::log_level() const { return log_level_; }
size_t Configuration::sprite_cache_size() const { return sprite_cache_size_; }

std::string Configuration::string_env(const std::string &envkey, const std::string &default_value) const {
    const auto value = std::getenv(envkey.c_str());
    if (!value || trim(value).empty())
        return default_value;
    return std::string(trim(value));
}

int Configuration::int_env(const std::string &envkey, const int default_value) const {
    const auto value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    if (!is_number(trim(value)))
        throw std::invalid_argument(
            fmt::format("An environment variable called {} must be a number, not '{}'", envkey, value));
    return std::atoi(value);
}

Configuration &Configuration::singleton() {
    static Configuration singleton;
    return singleton;
}
