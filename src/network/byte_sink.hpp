/**
 * @file byte_sink.hpp
 * @brief Destination for finished packets.
 *
 * The packet buffer hands each packet to write() as one unit and then
 * signals flush(). A sink is owned exclusively by one buffer.
 */

#pragma once

#include "core/result.hpp"

#include <string_view>

namespace statsd_emitter {

class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// Transmit one packet. Datagram sinks send it as a single datagram.
    virtual Result<void> write(std::string_view packet) = 0;

    /// Commit anything the sink itself buffers.
    virtual Result<void> flush() = 0;

    /// Release the underlying resource. Further writes fail.
    virtual Result<void> close() = 0;
};

}  // namespace statsd_emitter
