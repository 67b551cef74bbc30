#include "CancelToken.h"
#include "SpeedTestClient.h"
#include "TransferServer.h"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <set>
#include <stdexcept>

namespace {

class ClientRound : public ::testing::Test {
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

        args_.udp.recv_timeout_ms = 1000;
    }

    void TearDown() override {
        if (server_) server_->stop();
    }

    std::unique_ptr<TransferServer> server_;
    ServerEndpoint endpoint_;
    SpeedTestClientArgs args_;
};

uint16_t closed_tcp_port() {
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

// Mapped address space of this process in bytes.
size_t address_space_in_use() {
    std::ifstream statm("/proc/self/statm");
    size_t pages = 0;
    statm >> pages;
    return pages * static_cast<size_t>(sysconf(_SC_PAGESIZE));
}

// Under a tight address-space limit only a handful of task threads can get a
// stack. Exits 0 when the round still finishes and accounts for all 1000 tasks.
void run_round_with_scarce_address_space() {
    ServerEndpoint ep{"127.0.0.1", 0, closed_tcp_port()};
    SpeedTestClientArgs args;
    args.tcp.connect_timeout_ms = 500;
    SpeedTestClient client(args);

    rlimit lim{};
    lim.rlim_cur = address_space_in_use() + 64u * 1024 * 1024;
    lim.rlim_max = lim.rlim_cur;
    if (setrlimit(RLIMIT_AS, &lim) != 0) std::exit(2);

    RoundReport report = client.run(ep, 1000, 1000, 0);
    bool ok = report.results.empty() && report.failures.size() == 1000u;
    std::exit(ok ? 0 : 1);
}

} // namespace

TEST_F(ClientRound, MixedRoundProducesOneResultPerTask) {
    SpeedTestClient client(args_);
    RoundReport report = client.run(endpoint_, 5000, 3, 2);

    ASSERT_EQ(report.results.size(), 5u);
    EXPECT_TRUE(report.failures.empty());

    std::set<int> tcp_ids, udp_ids;
    for (const auto& r : report.results) {
        EXPECT_EQ(r.requested_size, 5000u);
        if (r.protocol == TransferProtocol::TCP) {
            tcp_ids.insert(r.id);
            EXPECT_EQ(r.bytes_received, 5000u);
        } else {
            udp_ids.insert(r.id);
            EXPECT_EQ(r.packets_expected, 5u);
        }
    }
    EXPECT_EQ(tcp_ids, (std::set<int>{1, 2, 3}));
    EXPECT_EQ(udp_ids, (std::set<int>{1, 2}));

    EXPECT_EQ(report.summary.tcp_count, 3u);
    EXPECT_EQ(report.summary.udp_count, 2u);
    ASSERT_TRUE(report.summary.avg_tcp_bps.has_value());
    ASSERT_TRUE(report.summary.avg_udp_bps.has_value());
    EXPECT_GT(*report.summary.avg_tcp_bps, 0.0);
}

TEST_F(ClientRound, TcpOnlyRoundLeavesUdpAverageUnset) {
    SpeedTestClient client(args_);
    RoundReport report = client.run(endpoint_, 2048, 2, 0);
    EXPECT_EQ(report.results.size(), 2u);
    EXPECT_TRUE(report.summary.avg_tcp_bps.has_value());
    EXPECT_FALSE(report.summary.avg_udp_bps.has_value());
    EXPECT_FALSE(report.summary.avg_udp_loss_rate.has_value());
}

TEST_F(ClientRound, FailedTcpTaskDoesNotSinkTheRound) {
    ServerEndpoint broken = endpoint_;
    broken.tcp_port = closed_tcp_port();

    SpeedTestClient client(args_);
    RoundReport report = client.run(broken, 3000, 2, 1);

    ASSERT_EQ(report.failures.size(), 2u);
    for (const auto& f : report.failures) {
        EXPECT_EQ(f.protocol, TransferProtocol::TCP);
        EXPECT_FALSE(f.error.empty());
    }
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_EQ(report.results[0].protocol, TransferProtocol::UDP);
    EXPECT_DOUBLE_EQ(report.results[0].loss_rate(), 0.0);
    EXPECT_EQ(report.summary.tcp_count, 0u);
    EXPECT_FALSE(report.summary.avg_tcp_bps.has_value());
}

TEST_F(ClientRound, ExternalCancelEndsTheRound) {
    ServerEndpoint silent = endpoint_;
    silent.udp_port = closed_tcp_port();

    CancelToken cancel;
    cancel.cancel();
    args_.cancel = &cancel;
    args_.udp.recv_timeout_ms = 5000;

    SpeedTestClient client(args_);
    auto t0 = std::chrono::steady_clock::now();
    RoundReport report = client.run(silent, 4096, 0, 2);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(3));
    EXPECT_EQ(report.results.size() + report.failures.size(), 2u);
}

TEST(SpeedTestClientTest, InvalidRoundsAreRejected) {
    ServerEndpoint ep{"127.0.0.1", 1, 1};
    SpeedTestClientArgs args;
    args.max_tasks = 4;
    SpeedTestClient client(args);

    EXPECT_THROW(client.run(ep, 0, 1, 1), std::invalid_argument);
    EXPECT_THROW(client.run(ep, 100, -1, 1), std::invalid_argument);
    EXPECT_THROW(client.run(ep, 100, 1, -1), std::invalid_argument);
    EXPECT_THROW(client.run(ep, 100, 0, 0), std::invalid_argument);
    EXPECT_THROW(client.run(ep, 100, 3, 2), std::invalid_argument);
}

TEST(SpeedTestClientTest, ValidateRejectsOversizedRoundUpFront) {
    SpeedTestClientArgs args;
    SpeedTestClient client(args);
    EXPECT_THROW(client.validate(1000, 2000, 0), std::invalid_argument);
    EXPECT_THROW(client.validate(1000, 1000, 25), std::invalid_argument);
    EXPECT_NO_THROW(client.validate(1000, 1000, 24));
    EXPECT_NO_THROW(client.validate(1, 0, 1));
}

TEST(SpeedTestClientTest, RoundDeadlineCancelsSlowTasks) {
    // Nothing answers on this port, so each UDP task would otherwise wait out
    // two full receive timeouts.
    ServerEndpoint ep{"127.0.0.1", closed_tcp_port(), 0};
    SpeedTestClientArgs args;
    args.udp.recv_timeout_ms = 5000;
    args.round_deadline_ms = 200;
    SpeedTestClient client(args);

    auto t0 = std::chrono::steady_clock::now();
    RoundReport report = client.run(ep, 4096, 0, 2);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));

    ASSERT_EQ(report.results.size(), 2u);
    for (const auto& r : report.results) {
        EXPECT_EQ(r.packets_received, 0u);
        EXPECT_DOUBLE_EQ(r.loss_rate(), 1.0);
    }
}

TEST(SpeedTestClientDeathTest, ThreadStartFailureStillCompletesRound) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT(run_round_with_scarce_address_space(), ::testing::ExitedWithCode(0), "");
}
