#include "CancelToken.h"
#include "TcpTransfer.h"
#include "TransferServer.h"
#include "UdpTransfer.h"
#include "speedtest_protocol.h"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

class LoopbackServer : public ::testing::Test {
protected:
    void SetUp() override {
        TransferServerArgs a;
        a.poll_ms = 50;
        server_ = std::make_unique<TransferServer>(a);
        ASSERT_TRUE(server_->init());
        ASSERT_TRUE(server_->start());
        endpoint_.ip = "127.0.0.1";
        endpoint_.udp_port = server_->udp_port();
        endpoint_.tcp_port = server_->tcp_port();
    }

    void TearDown() override {
        if (server_) server_->stop();
    }

    std::unique_ptr<TransferServer> server_;
    ServerEndpoint endpoint_;
};

// Accepts one connection, reads the request line, writes `send_bytes`, then
// holds the connection open for `hold_ms` before closing.
class ShortTcpPeer {
public:
    explicit ShortTcpPeer(size_t send_bytes, int hold_ms = 0) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, (sockaddr*)&addr, sizeof(addr));
        ::listen(fd_, 1);
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, (sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, send_bytes, hold_ms] {
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) return;
            char ch = 0;
            while (::recv(c, &ch, 1, 0) == 1 && ch != '\n') {}
            std::string filler(send_bytes, '0');
            ::send(c, filler.data(), filler.size(), MSG_NOSIGNAL);
            if (hold_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms));
            ::close(c);
        });
    }

    ~ShortTcpPeer() {
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    uint16_t port() const { return port_; }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

sockaddr_in loopback_addr(uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port);
    return addr;
}

// A scripted UDP endpoint on 127.0.0.1 for driving one side of a transfer.
class UdpPeer {
public:
    UdpPeer() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr = loopback_addr(0);
        ::bind(fd_, (sockaddr*)&addr, sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, (sockaddr*)&addr, &len);
        port_ = ntohs(addr.sin_port);

        timeval tv{};
        tv.tv_sec = 3;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    ~UdpPeer() { ::close(fd_); }

    uint16_t port() const { return port_; }

    // Wait for the next Request. False on timeout.
    bool await_request(sockaddr_in& from) {
        std::vector<uint8_t> buf(kMaxDatagram);
        while (true) {
            socklen_t len = sizeof(from);
            ssize_t n = recvfrom(fd_, buf.data(), buf.size(), 0, (sockaddr*)&from, &len);
            if (n < 0) return false;
            auto frame = decode_frame(buf.data(), (size_t)n);
            if (frame && std::holds_alternative<RequestMsg>(*frame)) return true;
        }
    }

    void send_frame(const sockaddr_in& to, const Frame& f) {
        send_bytes(to, encode_frame(f));
    }

    void send_bytes(const sockaddr_in& to, const std::vector<uint8_t>& bytes) {
        sendto(fd_, bytes.data(), bytes.size(), 0, (const sockaddr*)&to, sizeof(to));
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

PayloadMsg segment(uint64_t total, uint64_t index, size_t len) {
    PayloadMsg m;
    m.total_segments = total;
    m.segment_index = index;
    m.data.assign(len, 'X');
    return m;
}

// Connected TCP socket with a 3 s receive timeout, or -1.
int connect_loopback(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    timeval tv{};
    tv.tv_sec = 3;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    sockaddr_in addr = loopback_addr(port);
    if (::connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

uint16_t unused_tcp_port() {
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(s, (sockaddr*)&addr, sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(s, (sockaddr*)&addr, &len);
    ::close(s);
    return ntohs(addr.sin_port);
}

} // namespace

TEST_F(LoopbackServer, TcpDeliversExactlyRequestedBytes) {
    TcpTransfer t(endpoint_, TcpTransferArgs{});
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 5000, r, err)) << err;

    EXPECT_EQ(r.id, 1);
    EXPECT_EQ(r.protocol, TransferProtocol::TCP);
    EXPECT_EQ(r.requested_size, 5000u);
    EXPECT_EQ(r.bytes_received, 5000u);
    EXPECT_GT(r.bits_per_second, 0.0);
}

TEST_F(LoopbackServer, TcpLargeTransfer) {
    TcpTransfer t(endpoint_, TcpTransferArgs{});
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(2, 8 * 1024 * 1024 + 7, r, err)) << err;
    EXPECT_EQ(r.bytes_received, 8u * 1024 * 1024 + 7);
}

TEST_F(LoopbackServer, UdpDeliversAllSegmentsWithoutLoss) {
    UdpTransferArgs a;
    a.recv_timeout_ms = 1000;
    UdpTransfer t(endpoint_, a);
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 5000, r, err)) << err;

    EXPECT_EQ(r.protocol, TransferProtocol::UDP);
    EXPECT_EQ(r.packets_expected, 5u);
    EXPECT_EQ(r.packets_received, 5u);
    EXPECT_DOUBLE_EQ(r.loss_rate(), 0.0);
    EXPECT_EQ(r.bytes_received, 5000u);   // byte-accurate final segment
    EXPECT_GT(r.bits_per_second, 0.0);

    EXPECT_TRUE(t.tracker().complete());
    EXPECT_EQ(t.tracker().unique_received(), 5u);
}

TEST_F(LoopbackServer, UdpSilentServerCountsAsFullLoss) {
    ServerEndpoint dead = endpoint_;
    dead.udp_port = unused_tcp_port();   // nothing bound there for UDP either, most likely

    UdpTransferArgs a;
    a.recv_timeout_ms = 100;
    UdpTransfer t(dead, a);
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 3000, r, err)) << err;
    EXPECT_EQ(r.packets_expected, 3u);
    EXPECT_EQ(r.packets_received, 0u);
    EXPECT_DOUBLE_EQ(r.loss_rate(), 1.0);
}

TEST_F(LoopbackServer, ServerCountsCompletedTransfers) {
    {
        TcpTransfer t(endpoint_, TcpTransferArgs{});
        TransferResult r;
        std::string err;
        ASSERT_TRUE(t.run(1, 1000, r, err)) << err;
    }
    // The worker finishes asynchronously after closing the socket.
    for (int i = 0; i < 100 && server_->tcp_transfers_completed() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server_->tcp_transfers_completed(), 1u);
}

TEST(TcpTransferTest, EarlyCloseIsAShortTransfer) {
    ShortTcpPeer peer(1234);
    ServerEndpoint ep{"127.0.0.1", 0, peer.port()};

    TcpTransfer t(ep, TcpTransferArgs{});
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(3, 5000, r, err)) << err;
    EXPECT_EQ(r.bytes_received, 1234u);
    EXPECT_GT(r.bits_per_second, 0.0);
}

TEST(TcpTransferTest, StalledStreamEndsAtIdleTimeout) {
    ShortTcpPeer peer(100, 3000);
    ServerEndpoint ep{"127.0.0.1", 0, peer.port()};

    TcpTransferArgs a;
    a.idle_timeout_ms = 300;
    TcpTransfer t(ep, a);
    TransferResult r;
    std::string err;
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(t.run(1, 5000, r, err)) << err;
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(1500));
    EXPECT_EQ(r.bytes_received, 100u);
}

TEST(TcpTransferTest, RefusedConnectionIsAFailure) {
    ServerEndpoint ep{"127.0.0.1", 0, unused_tcp_port()};
    TcpTransfer t(ep, TcpTransferArgs{});
    TransferResult r;
    std::string err;
    EXPECT_FALSE(t.run(1, 5000, r, err));
    EXPECT_FALSE(err.empty());
}

TEST(TcpTransferTest, InvalidAddressIsAFailure) {
    ServerEndpoint ep{"not-an-ip", 0, 1};
    TcpTransfer t(ep, TcpTransferArgs{});
    TransferResult r;
    std::string err;
    EXPECT_FALSE(t.run(1, 10, r, err));
}

TEST(UdpTransferTest, CancelledBeforeDataEndsQuickly) {
    ServerEndpoint ep{"127.0.0.1", unused_tcp_port(), 0};
    UdpTransferArgs a;
    a.recv_timeout_ms = 5000;
    UdpTransfer t(ep, a);

    CancelToken cancel;
    cancel.cancel();
    TransferResult r;
    std::string err;
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(t.run(1, 1024, r, err, &cancel));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(1));
    EXPECT_EQ(r.packets_received, 0u);
}

TEST_F(LoopbackServer, InvalidSizeRequestIsClosedWithoutData) {
    int fd = connect_loopback(endpoint_.tcp_port);
    ASSERT_GE(fd, 0);
    const std::string req = "12ab\n";
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), (ssize_t)req.size());

    char buf[16];
    EXPECT_EQ(::recv(fd, buf, sizeof(buf), 0), 0);
    ::close(fd);
    EXPECT_EQ(server_->tcp_transfers_completed(), 0u);
}

TEST_F(LoopbackServer, OverlongRequestLineIsRejected) {
    int fd = connect_loopback(endpoint_.tcp_port);
    ASSERT_GE(fd, 0);
    const std::string req(200, '1');   // no newline within the line limit
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), (ssize_t)req.size());

    // Closed with unread input, so either EOF or a reset; never filler bytes.
    char buf[16];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    int recv_errno = errno;
    ::close(fd);
    EXPECT_LE(n, 0);
    if (n < 0) {
        EXPECT_NE(recv_errno, EAGAIN);
    }
    EXPECT_EQ(server_->tcp_transfers_completed(), 0u);
}

TEST(TransferServerTest, UdpSendJobStopsAtItsTimeCap) {
    TransferServerArgs a;
    a.poll_ms = 50;
    a.udp_max_ms = 200;
    TransferServer server(a);
    ASSERT_TRUE(server.init());
    ASSERT_TRUE(server.start());

    {
        // The requester vanishes right away; the job must still end on its own.
        UdpPeer client;
        client.send_frame(loopback_addr(server.udp_port()), RequestMsg{~0ull});
    }

    ASSERT_TRUE(wait_until([&server] { return server.active_workers() == 1; }, 2000));
    EXPECT_TRUE(wait_until([&server] { return server.active_workers() == 0; }, 3000));
    EXPECT_EQ(server.udp_transfers_completed(), 0u);
    server.stop();
}

TEST(TransferServerTest, RequestsBeyondWorkerLimitAreRefused) {
    TransferServerArgs a;
    a.poll_ms = 50;
    a.max_workers = 1;
    a.udp_max_ms = 5000;
    TransferServer server(a);
    ASSERT_TRUE(server.init());
    ASSERT_TRUE(server.start());

    UdpPeer first;
    UdpPeer second;
    first.send_frame(loopback_addr(server.udp_port()), RequestMsg{~0ull});
    ASSERT_TRUE(wait_until([&server] { return server.active_workers() == 1; }, 2000));

    second.send_frame(loopback_addr(server.udp_port()), RequestMsg{1024});
    EXPECT_TRUE(wait_until([&server] { return server.requests_refused() == 1; }, 2000));
    EXPECT_EQ(server.active_workers(), 1);

    // Shutdown interrupts the running job instead of waiting out its cap.
    auto t0 = std::chrono::steady_clock::now();
    server.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
    EXPECT_EQ(server.active_workers(), 0);
}

TEST(UdpTransferTest, LostRequestIsSentAgainOnce) {
    UdpPeer peer;
    std::thread responder([&peer] {
        sockaddr_in from{};
        if (!peer.await_request(from)) return;   // first Request goes unanswered
        if (!peer.await_request(from)) return;
        peer.send_frame(from, segment(2, 0, 1024));
        peer.send_frame(from, segment(2, 1, 1024));
    });

    ServerEndpoint ep{"127.0.0.1", peer.port(), 0};
    UdpTransferArgs a;
    a.recv_timeout_ms = 300;
    UdpTransfer t(ep, a);
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 2048, r, err)) << err;
    responder.join();

    EXPECT_EQ(r.packets_received, 2u);
    EXPECT_EQ(r.bytes_received, 2048u);
    EXPECT_DOUBLE_EQ(r.loss_rate(), 0.0);
}

TEST(UdpTransferTest, RepeatedSegmentsAreCountedOnce) {
    UdpPeer peer;
    std::thread responder([&peer] {
        sockaddr_in from{};
        if (!peer.await_request(from)) return;
        for (uint64_t i = 0; i < 5; ++i) {
            for (int copy = 0; copy < 3; ++copy) {
                peer.send_frame(from, segment(5, i, segment_length(5000, i)));
            }
        }
    });

    ServerEndpoint ep{"127.0.0.1", peer.port(), 0};
    UdpTransferArgs a;
    a.recv_timeout_ms = 1000;
    UdpTransfer t(ep, a);
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 5000, r, err)) << err;
    responder.join();

    EXPECT_EQ(r.packets_received, 5u);
    EXPECT_EQ(r.bytes_received, 5000u);
    // Segments 0..3 each arrive twice more before segment 4 completes the set.
    EXPECT_EQ(t.duplicates(), 8u);
}

TEST(UdpTransferTest, ShrunkTotalDropsBytesOfSegmentsOutsideIt) {
    UdpPeer peer;
    std::thread responder([&peer] {
        sockaddr_in from{};
        if (!peer.await_request(from)) return;
        peer.send_frame(from, segment(4, 3, 1024));
        for (uint64_t i = 0; i < 3; ++i) peer.send_frame(from, segment(3, i, 1024));
    });

    ServerEndpoint ep{"127.0.0.1", peer.port(), 0};
    UdpTransferArgs a;
    a.recv_timeout_ms = 1000;
    UdpTransfer t(ep, a);
    TransferResult r;
    std::string err;
    ASSERT_TRUE(t.run(1, 4096, r, err)) << err;
    responder.join();

    EXPECT_EQ(r.packets_expected, 3u);
    EXPECT_EQ(r.packets_received, 3u);
    EXPECT_EQ(r.bytes_received, 3072u);
}

TEST(UdpTransferTest, NoiseDoesNotKeepTheTransferAlive) {
    UdpPeer peer;
    std::thread responder([&peer] {
        sockaddr_in from{};
        if (!peer.await_request(from)) return;
        peer.send_frame(from, segment(3, 0, 1024));
        for (int i = 0; i < 30; ++i) {
            peer.send_bytes(from, {0x01, 0x02, 0x03});
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    ServerEndpoint ep{"127.0.0.1", peer.port(), 0};
    UdpTransferArgs a;
    a.recv_timeout_ms = 300;
    UdpTransfer t(ep, a);
    TransferResult r;
    std::string err;
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(t.run(1, 3072, r, err)) << err;
    auto took = std::chrono::steady_clock::now() - t0;
    responder.join();

    EXPECT_LT(took, std::chrono::milliseconds(1200));
    EXPECT_EQ(r.packets_received, 1u);
}
