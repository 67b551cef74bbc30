#pragma once

#include "speedtest_protocol.h"

#include <netinet/in.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct OfferBroadcasterArgs {
    uint16_t udp_port = 0;                       // advertised transfer ports
    uint16_t tcp_port = 0;
    uint16_t discovery_port = kDiscoveryPort;    // destination port
    std::optional<std::string> broadcast_ip;     // override; derived from the route when unset
    int interval_ms = 1000;                      // offer period
};

// Derive the /24 broadcast address for `local` (a.b.c.d -> a.b.c.255).
in_addr subnet_broadcast_address(in_addr local);

// Local IPv4 address the kernel would use to reach the outside world.
std::optional<in_addr> outbound_ipv4_address();

class OfferBroadcaster {
public:
    explicit OfferBroadcaster(const OfferBroadcasterArgs& args);
    ~OfferBroadcaster();

    OfferBroadcaster(const OfferBroadcaster&) = delete;
    OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;

    bool init();

    // Launch the periodic sender thread. Runs until stop().
    bool start();
    void stop();

    // Send a single Offer now.
    bool send_offer();

    uint64_t offers_sent() const { return sent_.load(); }
    const std::string& destination_ip() const { return dest_ip_; }

private:
    void run_loop();

private:
    OfferBroadcasterArgs A;
    int fd = -1;
    sockaddr_in dest{};
    std::string dest_ip_;
    std::vector<uint8_t> offer_bytes_;

    std::thread thread_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<uint64_t> sent_{0};
};
