/**
 * @file udp_sink.hpp
 * @brief Connected UDP socket used as the packet destination.
 *
 * dial() resolves "host:port", creates a datagram socket and connects it so
 * every packet goes to the same collector with a plain send(). Delivery is
 * fire-and-forget: a successful write only means the kernel accepted the
 * datagram.
 */

#pragma once

#include "core/types.hpp"
#include "network/byte_sink.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace statsd_emitter {

struct HostPort {
    std::string host;
    std::string port;
};

/**
 * @brief Split "host:port", "[v6-host]:port" or ":port" (local host).
 */
Result<HostPort> split_host_port(std::string_view address);

class UdpSink : public ByteSink {
public:
    /**
     * @brief Resolve @p address and connect a datagram socket to it.
     *
     * @param timeout Upper bound on name resolution and socket setup.
     *                std::nullopt waits as long as the resolver does.
     */
    static Result<std::unique_ptr<UdpSink>> dial(
        std::string_view address,
        std::optional<Milliseconds> timeout = std::nullopt);

    ~UdpSink() override;

    // Non-copyable
    UdpSink(const UdpSink&) = delete;
    UdpSink& operator=(const UdpSink&) = delete;

    Result<void> write(std::string_view packet) override;
    Result<void> flush() override;
    Result<void> close() override;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

private:
    UdpSink(int fd, std::string peer);

    int fd_ = -1;
    std::string peer_;
};

}  // namespace statsd_emitter
