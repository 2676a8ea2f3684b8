/**
 * @file packet_buffer.hpp
 * @brief Batches formatted lines into size-bounded packets.
 *
 * Lines are joined with '\n' (separator, never terminator). The buffered
 * byte count never exceeds the capacity: an append that would overflow it
 * flushes the current packet first. Packets leave only on an explicit
 * flush() or on such an overflow; there is no background timer.
 *
 * PacketBuffer itself is not synchronized. Client serializes every call
 * under one mutex.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/byte_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace statsd_emitter {

class PacketBuffer {
public:
    /// Conservative size that fits common MTUs once IP/UDP headers are added.
    static constexpr size_t DEFAULT_CAPACITY = 512;

    /**
     * @param capacity Maximum packet size in bytes; <= 0 selects
     *                 DEFAULT_CAPACITY.
     */
    PacketBuffer(std::unique_ptr<ByteSink> sink,
                 int64_t capacity = 0,
                 OverflowPolicy policy = OverflowPolicy::Swallow);

    // Non-copyable
    PacketBuffer(const PacketBuffer&) = delete;
    PacketBuffer& operator=(const PacketBuffer&) = delete;

    /**
     * @brief Add one line to the current packet.
     *
     * Flushes first when the line plus its separator does not fit. If that
     * forced flush fails, OverflowPolicy::Swallow discards the unsent packet
     * and continues with an empty buffer; OverflowPolicy::Propagate returns
     * the error and leaves the line out. A line larger than the whole
     * capacity is sent on its own as a single oversized packet.
     */
    Result<void> append(std::string_view line);

    /**
     * @brief Send the buffered bytes as one packet.
     *
     * No-op when empty. On failure the bytes stay buffered and the sink's
     * error is returned unchanged.
     */
    Result<void> flush();

    /**
     * @brief Flush, then release the sink.
     *
     * If the flush fails the buffer stays open so the caller may retry.
     * Once closed, every operation returns ErrorKind::Closed.
     */
    Result<void> close();

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t buffered() const noexcept { return data_.size(); }
    [[nodiscard]] size_t available() const noexcept { return capacity_ - data_.size(); }
    [[nodiscard]] bool is_closed() const noexcept { return sink_ == nullptr; }
    [[nodiscard]] OverflowPolicy policy() const noexcept { return policy_; }

    /// Number of packets handed to the sink so far.
    [[nodiscard]] uint64_t packets_sent() const noexcept { return packets_sent_; }
    /// Packets thrown away by OverflowPolicy::Swallow.
    [[nodiscard]] uint64_t packets_dropped() const noexcept { return packets_dropped_; }

private:
    Result<void> send_packet(std::string_view packet);

    std::unique_ptr<ByteSink> sink_;
    size_t capacity_;
    OverflowPolicy policy_;
    std::string data_;
    uint64_t packets_sent_{0};
    uint64_t packets_dropped_{0};
};

}  // namespace statsd_emitter
