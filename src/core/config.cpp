/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace statsd_emitter {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [client]
        if (auto client = tbl["client"]; client.is_table()) {
            config.client.address = client["address"].value_or(config.client.address);
            config.client.prefix = client["prefix"].value_or(std::string{});
            config.client.max_packet_size =
                client["max_packet_size"].value_or(config.client.max_packet_size);

            auto timeout = client["connect_timeout_ms"].value_or(int64_t{0});
            if (timeout < 0) {
                return Error{ErrorKind::Config, "client.connect_timeout_ms must not be negative"};
            }
            config.client.connect_timeout_ms = static_cast<uint32_t>(timeout);

            auto policy_name = client["overflow_policy"].value_or(std::string{"swallow"});
            auto policy = parse_overflow_policy(policy_name);
            if (!policy) {
                return Error{ErrorKind::Config, "Unknown client.overflow_policy: " + policy_name};
            }
            config.client.overflow_policy = *policy;
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            auto level_name = logging["level"].value_or(std::string{"info"});
            auto level = parse_log_level(level_name);
            if (!level) {
                return Error{ErrorKind::Config, "Unknown logging.level: " + level_name};
            }
            config.logging.level = *level;
            config.logging.file = logging["file"].value_or(std::string{});
            config.logging.trace_lines = logging["trace_lines"].value_or(false);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace statsd_emitter
