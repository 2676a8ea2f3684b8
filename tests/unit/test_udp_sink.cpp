/**
 * @file test_udp_sink.cpp
 * @brief Unit tests for address parsing, UdpSink and StreamSink.
 */

#include "network/stream_sink.hpp"
#include "network/udp_sink.hpp"

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

using namespace statsd_emitter;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Loopback UDP receiver bound to an ephemeral port.
 */
class LoopbackReceiver {
public:
    LoopbackReceiver() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~LoopbackReceiver() {
        if (fd_ >= 0) ::close(fd_);
    }

    LoopbackReceiver(const LoopbackReceiver&) = delete;
    LoopbackReceiver& operator=(const LoopbackReceiver&) = delete;

    [[nodiscard]] std::string address() const { return "127.0.0.1:" + std::to_string(port_); }

    std::optional<std::string> receive(int timeout_ms = 2000) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, timeout_ms) <= 0) return std::nullopt;

        char buf[65536];
        auto n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0) return std::nullopt;
        return std::string(buf, static_cast<size_t>(n));
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace

// ═══════════════════════════════════════════════
// split_host_port
// ═══════════════════════════════════════════════

TEST(SplitHostPortTest, HostAndPort) {
    auto hp = split_host_port("localhost:8125");
    ASSERT_TRUE(hp.has_value());
    EXPECT_EQ(hp->host, "localhost");
    EXPECT_EQ(hp->port, "8125");
}

TEST(SplitHostPortTest, BracketedIpv6) {
    auto hp = split_host_port("[::1]:8125");
    ASSERT_TRUE(hp.has_value());
    EXPECT_EQ(hp->host, "::1");
    EXPECT_EQ(hp->port, "8125");
}

TEST(SplitHostPortTest, EmptyHostMeansLocal) {
    auto hp = split_host_port(":8125");
    ASSERT_TRUE(hp.has_value());
    EXPECT_TRUE(hp->host.empty());
    EXPECT_EQ(hp->port, "8125");
}

TEST(SplitHostPortTest, Malformed) {
    EXPECT_FALSE(split_host_port("localhost").has_value());
    EXPECT_FALSE(split_host_port("localhost:").has_value());
    EXPECT_FALSE(split_host_port("::1:8125").has_value());
    EXPECT_FALSE(split_host_port("[::1]8125").has_value());
    EXPECT_FALSE(split_host_port("[::1:8125").has_value());
}

// ═══════════════════════════════════════════════
// UdpSink
// ═══════════════════════════════════════════════

TEST(UdpSinkTest, WriteSendsOneDatagram) {
    LoopbackReceiver receiver;
    auto sink = UdpSink::dial(receiver.address());
    ASSERT_TRUE(sink.has_value()) << sink.error().message;
    EXPECT_TRUE((*sink)->is_open());
    EXPECT_EQ((*sink)->peer(), receiver.address());

    ASSERT_TRUE((*sink)->write("a:1|c\nb:2|c"));
    ASSERT_TRUE((*sink)->flush());

    auto got = receiver.receive();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, "a:1|c\nb:2|c");
}

TEST(UdpSinkTest, DialWithTimeout) {
    LoopbackReceiver receiver;
    auto sink = UdpSink::dial(receiver.address(), 1000ms);
    ASSERT_TRUE(sink.has_value()) << sink.error().message;
    ASSERT_TRUE((*sink)->write("t:5|ms"));
    EXPECT_EQ(receiver.receive(), std::optional<std::string>("t:5|ms"));
}

TEST(UdpSinkTest, UnresolvableHost) {
    auto sink = UdpSink::dial("host.invalid:8125");
    ASSERT_FALSE(sink.has_value());
    EXPECT_EQ(sink.error().kind, ErrorKind::Transport);
}

TEST(UdpSinkTest, WriteAfterCloseFails) {
    LoopbackReceiver receiver;
    auto sink = UdpSink::dial(receiver.address());
    ASSERT_TRUE(sink.has_value());

    ASSERT_TRUE((*sink)->close());
    EXPECT_FALSE((*sink)->is_open());

    auto written = (*sink)->write("x:1|c");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, ErrorKind::Closed);
    EXPECT_FALSE((*sink)->close().has_value());
}

// ═══════════════════════════════════════════════
// StreamSink
// ═══════════════════════════════════════════════

TEST(StreamSinkTest, WritesBackToBack) {
    std::ostringstream out;
    StreamSink sink(out);
    ASSERT_TRUE(sink.write("a:1|c"));
    ASSERT_TRUE(sink.write("b:1|c"));
    ASSERT_TRUE(sink.flush());
    EXPECT_EQ(out.str(), "a:1|cb:1|c");
}

TEST(StreamSinkTest, BadStreamReportsWriteError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamSink sink(out);
    auto written = sink.write("a:1|c");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().kind, ErrorKind::Write);
}

TEST(StreamSinkTest, CloseDetaches) {
    std::ostringstream out;
    StreamSink sink(out);
    ASSERT_TRUE(sink.close());
    EXPECT_EQ(sink.write("a:1|c").error().kind, ErrorKind::Closed);
    EXPECT_TRUE(out.str().empty());
}
