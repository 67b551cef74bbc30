#include "TcpTransfer.h"
#include "speedtest_log.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <vector>

using Clock = std::chrono::steady_clock;

TcpTransfer::TcpTransfer(const ServerEndpoint& srv, const TcpTransferArgs& args)
    : server(srv), A(args) {}

TcpTransfer::~TcpTransfer() {
    if (fd >= 0) close(fd);
}

bool TcpTransfer::connect_with_timeout(std::string& err) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.tcp_port);
    if (inet_pton(AF_INET, server.ip.c_str(), &addr.sin_addr) != 1) {
        err = "invalid server address " + server.ip;
        return false;
    }

    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        err = std::string("socket: ") + std::strerror(errno);
        return false;
    }

    if (A.rcvbuf > 0 && setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &A.rcvbuf, sizeof(A.rcvbuf)) < 0) {
        log_errno("setsockopt SO_RCVBUF"); /* non-fatal */
    }

    // non-blocking for timed connect
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        err = std::string("fcntl(O_NONBLOCK): ") + std::strerror(errno);
        return false;
    }

    int ret = ::connect(fd, (sockaddr*)&addr, sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        err = std::string("connect: ") + std::strerror(errno);
        return false;
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int pr = ::poll(&pfd, 1, A.connect_timeout_ms);
        if (pr == 0) {
            err = "connect timeout";
            return false;
        }
        if (pr < 0) {
            err = std::string("poll: ") + std::strerror(errno);
            return false;
        }

        int so_error = 0;
        socklen_t slen = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &slen) < 0) {
            err = std::string("getsockopt(SO_ERROR): ") + std::strerror(errno);
            return false;
        }
        if (so_error != 0) {
            err = std::string("connect: ") + std::strerror(so_error);
            return false;
        }
    }
    return true;
}

bool TcpTransfer::send_request(uint64_t requested_size, std::string& err) {
    std::string line = format_size_request(requested_size);
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                if (::poll(&pfd, 1, A.connect_timeout_ms) <= 0) {
                    err = "timeout sending request";
                    return false;
                }
                continue;
            }
            err = std::string("send: ") + std::strerror(errno);
            return false;
        }
        off += (size_t)n;
    }
    return true;
}

bool TcpTransfer::run(int id, uint64_t requested_size, TransferResult& out, std::string& err,
                      const CancelToken* cancel) {
    out = TransferResult{};
    out.id = id;
    out.protocol = TransferProtocol::TCP;
    out.requested_size = requested_size;

    if (!connect_with_timeout(err)) return false;
    if (!send_request(requested_size, err)) return false;

    auto t0 = Clock::now();
    auto last_data = t0;
    uint64_t received = 0;
    std::vector<char> buf(64 * 1024);
    bool peer_closed = false;

    while (received < requested_size) {
        if (is_cancelled(cancel)) {
            log_line("TCP transfer #" + std::to_string(id) + " cancelled");
            break;
        }
        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_data);
        if (idle.count() >= A.idle_timeout_ms) {
            log_line("TCP transfer #" + std::to_string(id) + " stalled after " +
                     std::to_string(received) + " bytes");
            break;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int wait = static_cast<int>(std::min<long long>(A.poll_ms, A.idle_timeout_ms - idle.count()));
        int pr = ::poll(&pfd, 1, std::max(wait, 1));
        if (pr < 0) {
            if (errno == EINTR) continue;
            err = std::string("poll: ") + std::strerror(errno);
            return false;
        }
        if (pr == 0) continue;

        size_t want = (size_t)std::min<uint64_t>(buf.size(), requested_size - received);
        ssize_t n = ::recv(fd, buf.data(), want, 0);
        if (n > 0) {
            received += (uint64_t)n;
            last_data = Clock::now();
            continue;
        }
        if (n == 0) {
            peer_closed = true;
            break;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
        err = std::string("recv: ") + std::strerror(errno);
        return false;
    }

    auto t1 = (received > 0) ? last_data : Clock::now();
    out.bytes_received = received;
    out.elapsed_seconds = std::chrono::duration<double>(t1 - t0).count();
    out.bits_per_second = bits_per_second(received, out.elapsed_seconds);

    if (peer_closed && received < requested_size) {
        log_line("TCP transfer #" + std::to_string(id) + " short: server closed after " +
                 std::to_string(received) + "/" + std::to_string(requested_size) + " bytes");
    }
    close(fd);
    fd = -1;
    return true;
}
