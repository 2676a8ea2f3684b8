/**
 * @file udp_sink.cpp
 * @brief UdpSink implementation using POSIX datagram sockets.
 */

#include "network/udp_sink.hpp"

#include <cerrno>
#include <cstring>
#include <future>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <thread>
#include <unistd.h>

namespace statsd_emitter {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept {
        if (info != nullptr) ::freeaddrinfo(info);
    }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

Result<AddrInfoPtr> resolve(const HostPort& target) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo* raw = nullptr;
    const char* host = target.host.empty() ? nullptr : target.host.c_str();
    int rc = ::getaddrinfo(host, target.port.c_str(), &hints, &raw);
    if (rc != 0) {
        return Error{ErrorKind::Transport,
                     "Cannot resolve " + target.host + ":" + target.port + ": " + ::gai_strerror(rc)};
    }
    return AddrInfoPtr{raw};
}

/**
 * @brief Run the resolver on a detached thread so the caller can give up
 *        after @p timeout. A late answer is discarded with the task.
 */
Result<AddrInfoPtr> resolve_with_timeout(const HostPort& target, Milliseconds timeout) {
    auto task = std::make_shared<std::packaged_task<Result<AddrInfoPtr>()>>(
        [target] { return resolve(target); });
    auto future = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return Error{ErrorKind::Transport,
                     "Timed out resolving " + target.host + ":" + target.port};
    }
    return future.get();
}

}  // anonymous namespace

Result<HostPort> split_host_port(std::string_view address) {
    HostPort out;
    std::string_view rest;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string_view::npos) {
            return Error{ErrorKind::Transport, "Missing ']' in address: " + std::string{address}};
        }
        out.host = std::string{address.substr(1, close - 1)};
        rest = address.substr(close + 1);
        if (rest.empty() || rest.front() != ':') {
            return Error{ErrorKind::Transport, "Missing port in address: " + std::string{address}};
        }
        rest.remove_prefix(1);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string_view::npos) {
            return Error{ErrorKind::Transport, "Missing port in address: " + std::string{address}};
        }
        if (address.find(':') != colon) {
            return Error{ErrorKind::Transport,
                         "Too many colons in address (bracket IPv6 hosts): " + std::string{address}};
        }
        out.host = std::string{address.substr(0, colon)};
        rest = address.substr(colon + 1);
    }

    if (rest.empty()) {
        return Error{ErrorKind::Transport, "Missing port in address: " + std::string{address}};
    }
    out.port = std::string{rest};
    return out;
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

UdpSink::UdpSink(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {}

UdpSink::~UdpSink() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::unique_ptr<UdpSink>> UdpSink::dial(std::string_view address,
                                                std::optional<Milliseconds> timeout) {
    auto target = split_host_port(address);
    if (!target) {
        return target.error();
    }

    auto resolved = timeout ? resolve_with_timeout(*target, *timeout) : resolve(*target);
    if (!resolved) {
        return resolved.error();
    }

    // Connect to the first address that accepts a datagram socket.
    std::string last_error = "no usable address";
    for (const addrinfo* ai = resolved->get(); ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = std::strerror(errno);
            ::close(fd);
            continue;
        }
        return std::unique_ptr<UdpSink>(new UdpSink(fd, std::string{address}));
    }

    return Error{ErrorKind::Transport,
                 "Connect to " + std::string{address} + " failed: " + last_error};
}

// ─────────────────────────────────────────────
// ByteSink
// ─────────────────────────────────────────────

Result<void> UdpSink::write(std::string_view packet) {
    if (fd_ < 0) {
        return Error{ErrorKind::Closed, "UDP sink is closed"};
    }

    auto sent = ::send(fd_, packet.data(), packet.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        return Error{ErrorKind::Write,
                     "Send to " + peer_ + " failed: " + std::string(std::strerror(errno))};
    }
    if (static_cast<size_t>(sent) != packet.size()) {
        return Error{ErrorKind::Write, "Short datagram write to " + peer_};
    }
    return Result<void>{};
}

Result<void> UdpSink::flush() {
    // Datagrams leave on write(); nothing is held back.
    if (fd_ < 0) {
        return Error{ErrorKind::Closed, "UDP sink is closed"};
    }
    return Result<void>{};
}

Result<void> UdpSink::close() {
    if (fd_ < 0) {
        return Error{ErrorKind::Closed, "UDP sink is already closed"};
    }
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc < 0) {
        return Error{ErrorKind::Transport,
                     "Close of " + peer_ + " failed: " + std::string(std::strerror(errno))};
    }
    return Result<void>{};
}

}  // namespace statsd_emitter
