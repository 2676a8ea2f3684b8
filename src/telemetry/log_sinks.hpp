/**
 * @file log_sinks.hpp
 * @brief ILogSink destinations for the Logger front-end.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>

namespace statsd_emitter {

/**
 * @brief Appends NDJSON lines to a single file.
 */
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::filesystem::path& path);
    ~FileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const noexcept { return file_.is_open(); }

private:
    std::ofstream file_;
};

/**
 * @brief Writes to stderr so stdout stays free for command output.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace statsd_emitter
