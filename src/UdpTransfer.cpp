#include "UdpTransfer.h"
#include "speedtest_log.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <vector>

using Clock = std::chrono::steady_clock;

UdpTransfer::UdpTransfer(const ServerEndpoint& srv, const UdpTransferArgs& args)
    : server(srv), A(args) {}

UdpTransfer::~UdpTransfer() {
    if (fd >= 0) close(fd);
}

bool UdpTransfer::init(std::string& err) {
    std::memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(server.udp_port);
    if (inet_pton(AF_INET, server.ip.c_str(), &dest.sin_addr) != 1) {
        err = "invalid server address " + server.ip;
        return false;
    }

    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        err = std::string("socket: ") + std::strerror(errno);
        return false;
    }
    if (A.rcvbuf > 0 && setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &A.rcvbuf, sizeof(A.rcvbuf)) < 0) {
        log_errno("setsockopt SO_RCVBUF"); /* non-fatal */
    }
    return true;
}

bool UdpTransfer::send_request(uint64_t requested_size, std::string& err) {
    auto pkt = encode_frame(RequestMsg{requested_size});
    ssize_t n = sendto(fd, pkt.data(), pkt.size(), 0, (sockaddr*)&dest, sizeof(dest));
    if (n < 0) {
        err = std::string("sendto request: ") + std::strerror(errno);
        return false;
    }
    if ((size_t)n != pkt.size()) {
        err = "partial request send";
        return false;
    }
    return true;
}

bool UdpTransfer::run(int id, uint64_t requested_size, TransferResult& out, std::string& err,
                      const CancelToken* cancel) {
    out = TransferResult{};
    out.id = id;
    out.protocol = TransferProtocol::UDP;
    out.requested_size = requested_size;
    tracker_.reset();
    duplicates_ = 0;

    if (fd < 0 && !init(err)) return false;
    if (!send_request(requested_size, err)) return false;

    auto t0 = Clock::now();
    auto last_activity = t0;
    auto last_new_segment = t0;
    bool heard_anything = false;
    bool resent = false;

    std::vector<uint8_t> buf(kMaxDatagram);
    while (true) {
        if (is_cancelled(cancel)) {
            log_line("UDP transfer #" + std::to_string(id) + " cancelled");
            break;
        }

        auto now = Clock::now();
        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - t0).count();
        if (A.max_ms > 0 && elapsed_ms >= A.max_ms) {
            log_line("UDP transfer #" + std::to_string(id) + " hit the " + std::to_string(A.max_ms) +
                     " ms cap");
            break;
        }

        auto idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity).count();
        if (idle_ms >= A.recv_timeout_ms) {
            if (!heard_anything && A.resend_request && !resent) {
                log_debug("UDP transfer #" + std::to_string(id) + ": no response, re-sending request");
                if (!send_request(requested_size, err)) return false;
                resent = true;
                last_activity = now;
                continue;
            }
            break;
        }

        long long wait = std::min<long long>(A.poll_ms, A.recv_timeout_ms - idle_ms);
        if (A.max_ms > 0) wait = std::min<long long>(wait, A.max_ms - elapsed_ms);

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, static_cast<int>(std::max<long long>(wait, 1)));
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = std::string("poll: ") + std::strerror(errno);
            return false;
        }
        if (pr == 0) continue;

        ssize_t n = recvfrom(fd, buf.data(), buf.size(), MSG_DONTWAIT, nullptr, nullptr);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            // ICMP port-unreachable surfaces here when nothing listens on the server port
            if (errno == ECONNREFUSED) continue;
            err = std::string("recvfrom: ") + std::strerror(errno);
            return false;
        }
        // Only our own frames count as activity; noise must not hold the loop open.
        auto frame = decode_frame(buf.data(), (size_t)n);
        if (!frame) continue;

        if (std::holds_alternative<AckMsg>(*frame)) {
            last_activity = Clock::now();
            heard_anything = true;
            log_debug("UDP transfer #" + std::to_string(id) + ": server acknowledged request");
            continue;
        }

        const auto* p = std::get_if<PayloadMsg>(&*frame);
        if (!p) continue;
        last_activity = Clock::now();
        heard_anything = true;

        if (tracker_.record(p->total_segments, p->segment_index, p->data.size())) {
            if (p->segment_index < p->total_segments) last_new_segment = last_activity;
        } else {
            ++duplicates_;
        }
        if (tracker_.complete()) break;
    }

    const uint64_t bytes = tracker_.unique_bytes();
    auto t1 = tracker_.unique_received() > 0 ? last_new_segment : Clock::now();
    out.bytes_received = bytes;
    out.elapsed_seconds = std::chrono::duration<double>(t1 - t0).count();
    out.bits_per_second = bits_per_second(bytes, out.elapsed_seconds);
    out.packets_expected = tracker_.has_total() ? tracker_.total()
                                                : total_segments_for(requested_size);
    out.packets_received = tracker_.unique_received();
    return true;
}
