/**
 * @file client.hpp
 * @brief Statsd client: named metric operations over one buffered send path.
 *
 * Every operation reduces to send(stat, MetricRequest), which samples,
 * formats and appends the line to the packet buffer under a single mutex.
 * A Client may be shared by reference across threads. It cannot be copied
 * or moved; copies would split the buffered state.
 *
 * Shutdown: stop all producers, then call close(). Destroying a Client
 * that was not closed releases the socket without flushing.
 */

#pragma once

#include "client/formatter.hpp"
#include "client/observer.hpp"
#include "client/packet_buffer.hpp"
#include "client/sampler.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/byte_sink.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace statsd_emitter {

class Client {
public:
    static constexpr int64_t DEFAULT_PACKET_SIZE = static_cast<int64_t>(PacketBuffer::DEFAULT_CAPACITY);

    /**
     * @param sink            Destination for finished packets (owned).
     * @param max_packet_size <= 0 selects DEFAULT_PACKET_SIZE.
     */
    explicit Client(std::unique_ptr<ByteSink> sink,
                    int64_t max_packet_size = 0,
                    OverflowPolicy policy = OverflowPolicy::Swallow);

    // ── Connection helpers ───────────────────

    /// UDP client for "host:port" with the default packet size.
    static Result<std::unique_ptr<Client>> dial(std::string_view address);

    /// As dial(), bounding resolution and socket setup by @p timeout.
    static Result<std::unique_ptr<Client>> dial_timeout(std::string_view address,
                                                        Milliseconds timeout);

    /// As dial(), with an explicit maximum packet size.
    static Result<std::unique_ptr<Client>> dial_size(std::string_view address, int64_t size);

    /// Dial and configure prefix / packet size / policy from @p config.
    static Result<std::unique_ptr<Client>> from_config(const ClientConfig& config);

    // Non-copyable, non-movable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) = delete;
    Client& operator=(Client&&) = delete;

    // ── Setup (call before sharing the client) ─

    /**
     * @brief Literal prefix for every stat. No delimiter is added, so use
     *        "foo.bar." rather than "foo.bar".
     */
    void set_prefix(std::string prefix);
    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

    void set_observer(std::unique_ptr<SendObserver> observer);
    void set_sampler(Sampler sampler);

    // ── Core path ────────────────────────────

    /**
     * @brief Sample, format and buffer one metric.
     *
     * A sampled-away event returns success without touching the buffer.
     * Fails with ErrorKind::Closed after close().
     */
    Result<void> send(std::string_view stat, const MetricRequest& request);

    // ── Counters ─────────────────────────────

    Result<void> increment(std::string_view stat, int64_t count, double rate);
    Result<void> incr(std::string_view stat);
    Result<void> incr_by(std::string_view stat, int64_t n);
    Result<void> decrement(std::string_view stat, int64_t count, double rate);
    Result<void> decr(std::string_view stat);
    Result<void> decr_by(std::string_view stat, int64_t n);

    // ── Gauges ───────────────────────────────

    Result<void> gauge(std::string_view stat, int64_t value, double rate);
    Result<void> increment_gauge(std::string_view stat, int64_t value, double rate);
    Result<void> increment_gauge_by(std::string_view stat, int64_t value);
    Result<void> decrement_gauge(std::string_view stat, int64_t value, double rate);
    Result<void> decrement_gauge_by(std::string_view stat, int64_t value);

    // ── Timers ───────────────────────────────

    Result<void> timing(std::string_view stat, int64_t ms, double rate);

    /// Same wire type as timing(); kept for collectors that expect it.
    Result<void> histogram(std::string_view stat, int64_t value, double rate);

    template <typename Rep, typename Period>
    Result<void> duration(std::string_view stat,
                          std::chrono::duration<Rep, Period> elapsed,
                          double rate) {
        return timing(stat, to_milliseconds(elapsed), rate);
    }

    Result<void> duration_since(std::string_view stat, SteadyTime start);

    /**
     * @brief Run @p func and report how long it took.
     */
    template <typename F>
    Result<void> time(std::string_view stat, double rate, F&& func) {
        const auto start = std::chrono::steady_clock::now();
        std::invoke(std::forward<F>(func));
        return duration(stat, std::chrono::steady_clock::now() - start, rate);
    }

    // ── Sets / annotations ───────────────────

    Result<void> unique(std::string_view stat, int64_t value, double rate);

    /**
     * @brief Send an annotation whose text is std::format(fmt, args...).
     */
    template <typename... Args>
    Result<void> annotate(std::string_view name,
                          std::format_string<Args...> fmt,
                          Args&&... args) {
        return annotate_text(name, std::format(fmt, std::forward<Args>(args)...));
    }

    /// Annotation with pre-rendered text (no format substitution).
    Result<void> annotate_text(std::string_view name, std::string text);

    // ── Lifecycle ────────────────────────────

    /// Send whatever is buffered as one packet.
    Result<void> flush();

    /// Flush, then release the sink. Not safe against concurrent sends.
    Result<void> close();

    [[nodiscard]] bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    [[nodiscard]] size_t buffered() const;
    [[nodiscard]] size_t capacity() const noexcept { return buffer_.capacity(); }

private:
    std::string prefix_;
    Sampler sampler_;
    std::unique_ptr<SendObserver> observer_;

    mutable std::mutex buffer_mutex_;   ///< Guards buffer_
    PacketBuffer buffer_;
    std::atomic<bool> closed_{false};
};

}  // namespace statsd_emitter
