#include "OfferListener.h"
#include "speedtest_log.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

OfferListener::OfferListener(const OfferListenerArgs& args) : A(args) {}

OfferListener::~OfferListener() {
    if (fd >= 0) close(fd);
}

bool OfferListener::init() {
    fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) { log_errno("socket"); return false; }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        log_errno("setsockopt SO_REUSEADDR");
        return false;
    }
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) {
        log_errno("setsockopt SO_BROADCAST");
        return false;
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(A.port);
    if (bind(fd, (sockaddr*)&local, sizeof(local)) < 0) {
        log_errno("bind discovery port " + std::to_string(A.port));
        return false;
    }

    timeval tv{};
    tv.tv_sec = A.poll_ms / 1000;
    tv.tv_usec = (A.poll_ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        log_errno("setsockopt SO_RCVTIMEO");
        return false;
    }
    return true;
}

std::optional<ServerEndpoint> OfferListener::wait_for_offer(const CancelToken* cancel, int timeout_ms) {
    if (fd < 0) { log_line("OfferListener::wait_for_offer called before init"); return std::nullopt; }

    log_line("Awaiting server offers on port " + std::to_string(local_port()) + "...");

    auto start = Clock::now();
    std::vector<uint8_t> buf(kMaxDatagram);
    while (true) {
        if (is_cancelled(cancel)) return std::nullopt;
        if (timeout_ms > 0 && Clock::now() - start >= std::chrono::milliseconds(timeout_ms)) {
            log_line("No server offer within " + std::to_string(timeout_ms) + " ms");
            return std::nullopt;
        }

        sockaddr_in peer{};
        socklen_t alen = sizeof(peer);
        ssize_t n = recvfrom(fd, buf.data(), buf.size(), 0, (sockaddr*)&peer, &alen);
        if (n < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) continue;
            log_errno("recvfrom");
            return std::nullopt;
        }

        char ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

        auto frame = decode_frame(buf.data(), (size_t)n);
        if (!frame) {
            log_debug(std::string("Ignoring malformed datagram from ") + ip);
            continue;
        }
        const auto* offer = std::get_if<OfferMsg>(&*frame);
        if (!offer) {
            log_debug(std::string("Ignoring non-offer frame from ") + ip);
            continue;
        }

        ServerEndpoint ep;
        ep.ip = ip;
        ep.udp_port = offer->udp_port;
        ep.tcp_port = offer->tcp_port;
        log_line("Offer received from " + ep.label());
        return ep;
    }
}

uint16_t OfferListener::local_port() const {
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
    return 0;
}
