/**
 * @file stream_sink.hpp
 * @brief ByteSink over a caller-owned std::ostream.
 *
 * Useful for tests and for piping metrics to a file instead of a collector.
 * Packets are written back to back with no extra framing.
 */

#pragma once

#include "network/byte_sink.hpp"

#include <ostream>

namespace statsd_emitter {

class StreamSink : public ByteSink {
public:
    explicit StreamSink(std::ostream& out) : out_(&out) {}

    Result<void> write(std::string_view packet) override;
    Result<void> flush() override;
    Result<void> close() override;

private:
    std::ostream* out_;
};

}  // namespace statsd_emitter
