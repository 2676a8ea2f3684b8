/**
 * @file config.hpp
 * @brief Emitter configuration with TOML deserialization.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace statsd_emitter {

struct ClientConfig {
    std::string address = "127.0.0.1:8125";             ///< host:port of the collector
    std::string prefix;                                  ///< Literal, no delimiter added
    int64_t max_packet_size = 512;                       ///< <= 0 falls back to 512
    uint32_t connect_timeout_ms = 0;                     ///< 0 = no timeout
    OverflowPolicy overflow_policy = OverflowPolicy::Swallow;
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::filesystem::path file;                          ///< Empty = stderr
    bool trace_lines = false;                            ///< Log every line sent
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ClientConfig client;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown enum spellings
 * (log level, overflow policy) are reported as ErrorKind::Config.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace statsd_emitter
