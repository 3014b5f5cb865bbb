#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <string>

/**
 * Environment variables read by Configuration. All of them are optional.
 */
static inline constexpr auto OTITEMS_ATTRIBUTE_SERVER_ENV = "OTITEMS_ATTRIBUTE_SERVER";
static inline constexpr auto OTITEMS_LOG_LEVEL_ENV = "OTITEMS_LOG_LEVEL";
static inline constexpr auto OTITEMS_SPRITE_CACHE_SIZE_ENV = "OTITEMS_SPRITE_CACHE_SIZE";

static inline constexpr auto DefaultAttributeServer = "tfs1.4";
static inline constexpr size_t DefaultSpriteCacheSize = 256;

/**
 * Accessors for configuration settings. Client code should use
 * the static singleton.
 */
class Configuration {
public:
    Configuration();
    // Name of the items.xml dialect used when none is requested explicitly, e.g. "tfs1.4".
    [[nodiscard]] std::string attribute_server() const;
    [[nodiscard]] spdlog::level::level_enum log_level() const;
    [[nodiscard]] size_t sprite_cache_size() const;

    static Configuration &singleton();

private:
    [[nodiscard]] std::string string_env(const std::string &envkey, const std::string &default_value) const;
    [[nodiscard]] int int_env(const std::string &envkey, const int default_value) const;

    std::string attribute_server_;
    spdlog::level::level_enum log_level_;
    size_t sprite_cache_size_;
};
