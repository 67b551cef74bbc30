#include "OfferBroadcaster.h"
#include "speedtest_log.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <string>

in_addr subnet_broadcast_address(in_addr local) {
    in_addr out{};
    out.s_addr = htonl((ntohl(local.s_addr) & 0xFFFFFF00u) | 0x000000FFu);
    return out;
}

std::optional<in_addr> outbound_ipv4_address() {
    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0) { log_errno("socket"); return std::nullopt; }

    // connect() on UDP sends nothing; it only selects a route and source address.
    sockaddr_in probe{};
    probe.sin_family = AF_INET;
    probe.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &probe.sin_addr);

    std::optional<in_addr> result;
    if (::connect(s, (sockaddr*)&probe, sizeof(probe)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(s, (sockaddr*)&local, &len) == 0 && local.sin_addr.s_addr != htonl(INADDR_ANY)) {
            result = local.sin_addr;
        }
    }
    ::close(s);
    return result;
}

OfferBroadcaster::OfferBroadcaster(const OfferBroadcasterArgs& args) : A(args) {}

OfferBroadcaster::~OfferBroadcaster() {
    stop();
    if (fd >= 0) close(fd);
}

bool OfferBroadcaster::init() {
    fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) { log_errno("socket"); return false; }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) {
        log_errno("setsockopt SO_BROADCAST");
        return false;
    }

    std::memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(A.discovery_port);

    if (A.broadcast_ip) {
        if (inet_pton(AF_INET, A.broadcast_ip->c_str(), &dest.sin_addr) != 1) {
            log_line("Invalid broadcast IP: " + *A.broadcast_ip);
            return false;
        }
    } else if (auto local = outbound_ipv4_address()) {
        dest.sin_addr = subnet_broadcast_address(*local);
    } else {
        log_line("No outbound route found; falling back to 255.255.255.255");
        dest.sin_addr.s_addr = htonl(INADDR_BROADCAST);
    }

    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &dest.sin_addr, buf, sizeof(buf));
    dest_ip_ = buf;

    offer_bytes_ = encode_frame(OfferMsg{A.udp_port, A.tcp_port});

    log_line("Broadcasting offers to " + dest_ip_ + ":" + std::to_string(A.discovery_port) +
             " every " + std::to_string(A.interval_ms) + " ms (udp " +
             std::to_string(A.udp_port) + ", tcp " + std::to_string(A.tcp_port) + ")");
    return true;
}

bool OfferBroadcaster::start() {
    if (fd < 0) { log_line("OfferBroadcaster::start called before init"); return false; }
    if (thread_.joinable()) return true;
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = false;
    }
    thread_ = std::thread([this] { run_loop(); });
    return true;
}

void OfferBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool OfferBroadcaster::send_offer() {
    ssize_t n = sendto(fd, offer_bytes_.data(), offer_bytes_.size(), 0, (sockaddr*)&dest, sizeof(dest));
    if (n < 0) { log_errno("sendto offer"); return false; }
    if ((size_t)n != offer_bytes_.size()) {
        log_line("Partial offer send: sent=" + std::to_string(n));
        return false;
    }
    sent_.fetch_add(1);
    log_debug("Offer sent to " + dest_ip_);
    return true;
}

void OfferBroadcaster::run_loop() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stopping_) {
        lock.unlock();
        // Errors are logged by send_offer; keep advertising regardless.
        (void)send_offer();
        lock.lock();
        cv_.wait_for(lock, std::chrono::milliseconds(A.interval_ms), [this] { return stopping_; });
    }
}
