/**
 * @file packet_buffer.cpp
 * @brief PacketBuffer implementation.
 */

#include "client/packet_buffer.hpp"

namespace statsd_emitter {

namespace {

Error closed_error() {
    return Error{ErrorKind::Closed, "Packet buffer is closed"};
}

}  // anonymous namespace

PacketBuffer::PacketBuffer(std::unique_ptr<ByteSink> sink,
                           int64_t capacity,
                           OverflowPolicy policy)
    : sink_(std::move(sink))
    , capacity_(capacity > 0 ? static_cast<size_t>(capacity) : DEFAULT_CAPACITY)
    , policy_(policy) {
    data_.reserve(capacity_);
}

Result<void> PacketBuffer::append(std::string_view line) {
    if (is_closed()) return closed_error();

    const size_t separator = data_.empty() ? 0 : 1;
    if (available() < line.size() + separator) {
        auto flushed = flush();
        if (!flushed) {
            if (policy_ == OverflowPolicy::Propagate) {
                return flushed;
            }
            data_.clear();
            ++packets_dropped_;
        }
    }

    if (line.size() > capacity_) {
        // Cannot share a packet with anything; ship it alone.
        return send_packet(line);
    }

    if (!data_.empty()) {
        data_.push_back('\n');
    }
    data_.append(line);
    return Result<void>{};
}

Result<void> PacketBuffer::flush() {
    if (is_closed()) return closed_error();
    if (data_.empty()) return Result<void>{};

    auto sent = send_packet(data_);
    if (!sent) return sent;

    data_.clear();
    return Result<void>{};
}

Result<void> PacketBuffer::close() {
    if (is_closed()) return closed_error();

    auto flushed = flush();
    if (!flushed) return flushed;

    auto released = sink_->close();
    sink_.reset();
    data_.clear();
    data_.shrink_to_fit();
    return released;
}

Result<void> PacketBuffer::send_packet(std::string_view packet) {
    auto written = sink_->write(packet);
    if (!written) return written;

    ++packets_sent_;
    return sink_->flush();
}

}  // namespace statsd_emitter
