#include "TransferServer.h"
#include "SendPacer.h"
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
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr size_t kMaxRequestLine = 64;

bool set_timeout(int fd, int optname, int ms) {
    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    return setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv)) == 0;
}

uint16_t bound_port(int fd) {
    sockaddr_in sa{};
    socklen_t sl = sizeof(sa);
    if (getsockname(fd, (sockaddr*)&sa, &sl) == 0) return ntohs(sa.sin_port);
    return 0;
}

std::string addr_label(const sockaddr_in& a) {
    char ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &a.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(a.sin_port));
}

} // namespace

TransferServer::TransferServer(const TransferServerArgs& args) : A(args) {}

TransferServer::~TransferServer() {
    stop();
    if (tcp_fd >= 0) close(tcp_fd);
    if (udp_fd >= 0) close(udp_fd);
}

bool TransferServer::init() {
    if (A.redundancy < 1) {
        log_line("redundancy must be >= 1");
        return false;
    }
    if (A.max_workers < 1) {
        log_line("max_workers must be >= 1");
        return false;
    }

    tcp_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (tcp_fd < 0) { log_errno("socket tcp"); return false; }

    int opt = 1;
    if (setsockopt(tcp_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        log_errno("setsockopt(SO_REUSEADDR)");
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(A.tcp_port);
    if (bind(tcp_fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        log_errno("bind tcp");
        return false;
    }
    if (listen(tcp_fd, A.backlog) < 0) {
        log_errno("listen");
        return false;
    }

    udp_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (udp_fd < 0) { log_errno("socket udp"); return false; }

    addr.sin_port = htons(A.udp_port);
    if (bind(udp_fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        log_errno("bind udp");
        return false;
    }
    if (!set_timeout(udp_fd, SO_RCVTIMEO, A.poll_ms)) {
        log_errno("setsockopt SO_RCVTIMEO");
        return false;
    }

    tcp_port_ = bound_port(tcp_fd);
    udp_port_ = bound_port(udp_fd);

    log_line("Server listening: TCP port " + std::to_string(tcp_port_) + ", UDP port " +
             std::to_string(udp_port_) + " (redundancy=" + std::to_string(A.redundancy) +
             (A.pps > 0 ? ", pacing " + std::to_string((long long)A.pps) + " pkt/s)" : ", unpaced)"));
    return true;
}

bool TransferServer::start() {
    if (tcp_fd < 0 || udp_fd < 0) { log_line("TransferServer::start called before init"); return false; }
    if (tcp_thread_.joinable()) return true;
    stopping_.store(false);
    tcp_thread_ = std::thread([this] { tcp_accept_loop(); });
    udp_thread_ = std::thread([this] { udp_request_loop(); });
    return true;
}

void TransferServer::stop() {
    stopping_.store(true);
    if (tcp_thread_.joinable()) tcp_thread_.join();
    if (udp_thread_.joinable()) udp_thread_.join();

    std::unique_lock<std::mutex> lock(workers_mu_);
    workers_cv_.wait(lock, [this] { return active_workers_ == 0; });
}

bool TransferServer::spawn_worker(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(workers_mu_);
        if (active_workers_ >= A.max_workers) {
            refused_.fetch_add(1);
            return false;
        }
        ++active_workers_;
    }
    try {
        std::thread([this, fn = std::move(fn)] {
            fn();
            std::lock_guard<std::mutex> lock(workers_mu_);
            --active_workers_;
            workers_cv_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        log_line(std::string("Cannot start transfer worker: ") + e.what());
        std::lock_guard<std::mutex> lock(workers_mu_);
        --active_workers_;
        refused_.fetch_add(1);
        workers_cv_.notify_all();
        return false;
    }
    return true;
}

int TransferServer::active_workers() {
    std::lock_guard<std::mutex> lock(workers_mu_);
    return active_workers_;
}

void TransferServer::tcp_accept_loop() {
    while (!stopping_.load()) {
        pollfd pfd{};
        pfd.fd = tcp_fd;
        pfd.events = POLLIN;
        int pr = ::poll(&pfd, 1, A.poll_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            log_errno("poll accept");
            continue;
        }
        if (pr == 0) continue;

        sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        int conn_fd = ::accept(tcp_fd, (sockaddr*)&peer, &peer_len);
        if (conn_fd < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            log_errno("accept");
            continue;
        }

        std::string label = addr_label(peer);
        log_debug("Accepted TCP connection from " + label);
        if (!spawn_worker([this, conn_fd, label] { serve_tcp(conn_fd, label); })) {
            log_line("TCP " + label + ": refused, " + std::to_string(A.max_workers) + " transfers busy");
            close(conn_fd);
        }
    }
}

bool TransferServer::read_request_line(int conn_fd, std::string& line) {
    char c = 0;
    while (line.size() < kMaxRequestLine) {
        ssize_t n = ::recv(conn_fd, &c, 1, 0);
        if (n == 1) {
            if (c == '\n') return true;
            line.push_back(c);
            continue;
        }
        if (n == 0) return !line.empty();   // EOF without newline: take what came
        if (errno == EINTR) continue;
        return false;
    }
    return false;
}

void TransferServer::serve_tcp(int conn_fd, std::string peer) {
    if (!set_timeout(conn_fd, SO_RCVTIMEO, A.io_timeout_ms) ||
        !set_timeout(conn_fd, SO_SNDTIMEO, A.io_timeout_ms)) {
        log_errno("setsockopt timeouts");
    }

    std::string line;
    if (!read_request_line(conn_fd, line)) {
        log_line("TCP " + peer + ": no valid request line");
        close(conn_fd);
        return;
    }
    auto size = parse_size_request(line);
    if (!size) {
        log_line("TCP " + peer + ": invalid size request '" + line + "'");
        close(conn_fd);
        return;
    }
    log_line("TCP " + peer + ": request for " + std::to_string(*size) + " bytes");

    std::vector<char> chunk(kTcpChunkSize, '0');
    uint64_t sent = 0;
    while (sent < *size) {
        if (stopping_.load()) {
            log_line("TCP " + peer + ": aborted by shutdown after " + std::to_string(sent) + " bytes");
            close(conn_fd);
            return;
        }
        size_t want = (size_t)std::min<uint64_t>(chunk.size(), *size - sent);
        ssize_t n = ::send(conn_fd, chunk.data(), want, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_errno("TCP " + peer + ": send aborted after " + std::to_string(sent) + " bytes");
            close(conn_fd);
            return;
        }
        sent += (uint64_t)n;
    }

    close(conn_fd);
    tcp_done_.fetch_add(1);
    log_line("TCP " + peer + ": sent " + std::to_string(sent) + " bytes");
}

void TransferServer::udp_request_loop() {
    std::vector<uint8_t> buf(kMaxDatagram);
    while (!stopping_.load()) {
        sockaddr_in peer{};
        socklen_t alen = sizeof(peer);
        ssize_t n = recvfrom(udp_fd, buf.data(), buf.size(), 0, (sockaddr*)&peer, &alen);
        if (n < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) continue;
            log_errno("recvfrom");
            continue;
        }

        auto frame = decode_frame(buf.data(), (size_t)n);
        if (!frame) {
            log_debug("UDP: dropped malformed datagram from " + addr_label(peer));
            continue;
        }
        const auto* req = std::get_if<RequestMsg>(&*frame);
        if (!req) {
            log_debug("UDP: dropped unexpected frame from " + addr_label(peer));
            continue;
        }

        uint64_t size = req->requested_size;
        log_line("UDP " + addr_label(peer) + ": request for " + std::to_string(size) + " bytes");
        if (!spawn_worker([this, peer, size] { serve_udp(peer, size); })) {
            log_line("UDP " + addr_label(peer) + ": request refused, " + std::to_string(A.max_workers) +
                     " transfers busy");
            continue;
        }

        // Best-effort: the client only uses it to skip its request retry.
        auto ack = encode_frame(AckMsg{});
        if (sendto(udp_fd, ack.data(), ack.size(), 0, (sockaddr*)&peer, sizeof(peer)) < 0) {
            log_errno("sendto ack");
        }
    }
}

bool TransferServer::send_segment(const sockaddr_in& to, const std::vector<uint8_t>& pkt) {
    for (int attempt = 0; attempt < 50; ++attempt) {
        ssize_t n = sendto(udp_fd, pkt.data(), pkt.size(), 0, (const sockaddr*)&to, sizeof(to));
        if (n >= 0) {
            if ((size_t)n != pkt.size()) {
                log_line("Partial send!? sent=" + std::to_string(n) + " expected=" + std::to_string(pkt.size()));
                return false;
            }
            return true;
        }
        if (errno == EINTR) continue;
        if (errno == ENOBUFS || errno == EAGAIN || errno == EWOULDBLOCK) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        log_errno("sendto payload");
        return false;
    }
    log_line("sendto payload: socket buffer stayed full");
    return false;
}

void TransferServer::serve_udp(sockaddr_in client, uint64_t requested_size) {
    const std::string peer = addr_label(client);
    const uint64_t total = total_segments_for(requested_size);
    SendPacer pacer(A.pps);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(A.udp_max_ms);

    PayloadMsg msg;
    msg.total_segments = total;

    for (int pass = 0; pass < A.redundancy; ++pass) {
        for (uint64_t i = 0; i < total; ++i) {
            if (stopping_.load()) {
                log_line("UDP " + peer + ": aborted by shutdown");
                return;
            }
            // No feedback channel tells us the client left; stop when it would have given up.
            if (A.udp_max_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
                log_line("UDP " + peer + ": stopped after " + std::to_string(A.udp_max_ms) +
                         " ms at segment " + std::to_string(i) + " (pass " + std::to_string(pass + 1) + ")");
                return;
            }
            msg.segment_index = i;
            msg.data.assign(segment_length(requested_size, i), 'X');

            pacer.wait_and_record();
            if (!send_segment(client, encode_frame(msg))) {
                log_line("UDP " + peer + ": transfer aborted at segment " + std::to_string(i) +
                         " (pass " + std::to_string(pass + 1) + ")");
                return;
            }
            log_debug("UDP " + peer + ": segment " + std::to_string(i) + "/" + std::to_string(total) +
                      " pass " + std::to_string(pass + 1));
        }
    }

    udp_done_.fetch_add(1);
    log_line("UDP " + peer + ": sent " + std::to_string(total) + " segments x" +
             std::to_string(A.redundancy));
}
