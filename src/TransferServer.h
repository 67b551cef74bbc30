#pragma once

#include "speedtest_protocol.h"

#include <netinet/in.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct TransferServerArgs {
    uint16_t udp_port = 0;           // 0 = let the kernel pick
    uint16_t tcp_port = 0;           // 0 = let the kernel pick
    int redundancy = 3;              // passes over every UDP segment
    double pps = 0.0;                // UDP pacing, packets/s (0 = unlimited)
    int backlog = 128;
    int poll_ms = 200;               // accept/recv wake-up for shutdown checks
    int io_timeout_ms = 10000;       // per-connection send/recv timeout
    int max_workers = 256;           // concurrent transfers; requests beyond this are refused
    int udp_max_ms = 30000;          // wall-clock cap on one UDP send job (0 = none)
};

// Serves TCP byte streams and UDP segmented payloads on the ports it advertises.
class TransferServer {
public:
    explicit TransferServer(const TransferServerArgs& args);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Bind and listen on both ports.
    bool init();

    // Launch the TCP accept loop and the UDP request loop.
    bool start();

    // Stop accepting work and wait for every in-flight transfer to finish.
    void stop();

    uint16_t udp_port() const { return udp_port_; }
    uint16_t tcp_port() const { return tcp_port_; }

    uint64_t tcp_transfers_completed() const { return tcp_done_.load(); }
    uint64_t udp_transfers_completed() const { return udp_done_.load(); }
    uint64_t requests_refused() const { return refused_.load(); }
    int active_workers();

private:
    void tcp_accept_loop();
    void udp_request_loop();

    void serve_tcp(int conn_fd, std::string peer);
    void serve_udp(sockaddr_in client, uint64_t requested_size);

    bool read_request_line(int conn_fd, std::string& line);
    bool send_segment(const sockaddr_in& to, const std::vector<uint8_t>& pkt);

    // False when the worker limit is reached or no thread could be started.
    bool spawn_worker(std::function<void()> fn);

private:
    TransferServerArgs A;
    int tcp_fd = -1;
    int udp_fd = -1;
    uint16_t udp_port_ = 0;
    uint16_t tcp_port_ = 0;

    std::atomic<bool> stopping_{false};
    std::thread tcp_thread_;
    std::thread udp_thread_;

    std::mutex workers_mu_;
    std::condition_variable workers_cv_;
    int active_workers_ = 0;

    std::atomic<uint64_t> tcp_done_{0};
    std::atomic<uint64_t> udp_done_{0};
    std::atomic<uint64_t> refused_{0};
};
