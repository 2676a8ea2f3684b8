/**
 * @file client.cpp
 * @brief Client implementation.
 */

#include "client/client.hpp"

#include "network/udp_sink.hpp"

#include <optional>

namespace statsd_emitter {

namespace {

Result<std::unique_ptr<Client>> dial_udp(std::string_view address,
                                         std::optional<Milliseconds> timeout,
                                         int64_t size,
                                         OverflowPolicy policy) {
    auto sink = UdpSink::dial(address, timeout);
    if (!sink) {
        return sink.error();
    }
    return std::make_unique<Client>(std::move(sink).value(), size, policy);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Client::Client(std::unique_ptr<ByteSink> sink, int64_t max_packet_size, OverflowPolicy policy)
    : observer_(std::make_unique<NullObserver>())
    , buffer_(std::move(sink), max_packet_size, policy) {}

Result<std::unique_ptr<Client>> Client::dial(std::string_view address) {
    return dial_udp(address, std::nullopt, 0, OverflowPolicy::Swallow);
}

Result<std::unique_ptr<Client>> Client::dial_timeout(std::string_view address,
                                                     Milliseconds timeout) {
    return dial_udp(address, timeout, 0, OverflowPolicy::Swallow);
}

Result<std::unique_ptr<Client>> Client::dial_size(std::string_view address, int64_t size) {
    return dial_udp(address, std::nullopt, size, OverflowPolicy::Swallow);
}

Result<std::unique_ptr<Client>> Client::from_config(const ClientConfig& config) {
    std::optional<Milliseconds> timeout;
    if (config.connect_timeout_ms > 0) {
        timeout = Milliseconds{config.connect_timeout_ms};
    }

    auto client = dial_udp(config.address, timeout, config.max_packet_size,
                           config.overflow_policy);
    if (client) {
        (*client)->set_prefix(config.prefix);
    }
    return client;
}

void Client::set_prefix(std::string prefix) { prefix_ = std::move(prefix); }

void Client::set_observer(std::unique_ptr<SendObserver> observer) {
    observer_ = observer ? std::move(observer) : std::make_unique<NullObserver>();
}

void Client::set_sampler(Sampler sampler) { sampler_ = std::move(sampler); }

// ─────────────────────────────────────────────
// Core path
// ─────────────────────────────────────────────

Result<void> Client::send(std::string_view stat, const MetricRequest& request) {
    if (is_closed()) {
        return Error{ErrorKind::Closed, "Client is closed"};
    }

    auto decision = sampler_.decide(request.rate);
    if (decision == SampleDecision::Drop) {
        return Result<void>{};
    }

    auto line = format_line(prefix_, stat, request, decision == SampleDecision::EmitSampled);
    observer_->on_send(line, request);

    std::lock_guard lock(buffer_mutex_);
    return buffer_.append(line);
}

// ─────────────────────────────────────────────
// Named operations
// ─────────────────────────────────────────────

Result<void> Client::increment(std::string_view stat, int64_t count, double rate) {
    return send(stat, {MetricKind::Counter, count, rate});
}

Result<void> Client::incr(std::string_view stat) { return increment(stat, 1, 1.0); }
Result<void> Client::incr_by(std::string_view stat, int64_t n) { return increment(stat, n, 1.0); }

Result<void> Client::decrement(std::string_view stat, int64_t count, double rate) {
    return increment(stat, -count, rate);
}

Result<void> Client::decr(std::string_view stat) { return increment(stat, -1, 1.0); }
Result<void> Client::decr_by(std::string_view stat, int64_t n) { return increment(stat, -n, 1.0); }

Result<void> Client::gauge(std::string_view stat, int64_t value, double rate) {
    return send(stat, {MetricKind::Gauge, value, rate});
}

Result<void> Client::increment_gauge(std::string_view stat, int64_t value, double rate) {
    return send(stat, {MetricKind::GaugeIncrement, value, rate});
}

Result<void> Client::increment_gauge_by(std::string_view stat, int64_t value) {
    return increment_gauge(stat, value, 1.0);
}

Result<void> Client::decrement_gauge(std::string_view stat, int64_t value, double rate) {
    return send(stat, {MetricKind::GaugeDecrement, value, rate});
}

Result<void> Client::decrement_gauge_by(std::string_view stat, int64_t value) {
    return decrement_gauge(stat, value, 1.0);
}

Result<void> Client::timing(std::string_view stat, int64_t ms, double rate) {
    return send(stat, {MetricKind::Timing, ms, rate});
}

Result<void> Client::histogram(std::string_view stat, int64_t value, double rate) {
    return timing(stat, value, rate);
}

Result<void> Client::duration_since(std::string_view stat, SteadyTime start) {
    return duration(stat, std::chrono::steady_clock::now() - start, 1.0);
}

Result<void> Client::unique(std::string_view stat, int64_t value, double rate) {
    return send(stat, {MetricKind::Set, value, rate});
}

Result<void> Client::annotate_text(std::string_view name, std::string text) {
    return send(name, {MetricKind::Annotation, std::move(text), 1.0});
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Client::flush() {
    std::lock_guard lock(buffer_mutex_);
    return buffer_.flush();
}

Result<void> Client::close() {
    std::lock_guard lock(buffer_mutex_);
    auto closed = buffer_.close();
    if (buffer_.is_closed()) {
        closed_.store(true, std::memory_order_release);
    }
    return closed;
}

size_t Client::buffered() const {
    std::lock_guard lock(buffer_mutex_);
    return buffer_.buffered();
}

}  // namespace statsd_emitter
