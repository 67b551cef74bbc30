#include "SpeedTestClient.h"
#include "speedtest_log.h"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace {

// One-shot start line for a round. Tasks park in wait() until open() is called,
// so every spawned task starts together even when fewer tasks than planned came up.
class StartGate {
public:
    void wait() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return open_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lk(m_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    bool open_ = false;
    std::mutex m_;
    std::condition_variable cv_;
};

// Trips `target` when the deadline passes or `upstream` fires. Joins on destruction.
class RoundWatchdog {
public:
    RoundWatchdog(CancelToken& target, const CancelToken* upstream, int deadline_ms)
        : target_(target), upstream_(upstream), deadline_ms_(deadline_ms) {
        if (deadline_ms_ > 0 || upstream_ != nullptr) {
            try {
                thread_ = std::thread([this] { loop(); });
            } catch (const std::system_error& e) {
                log_line(std::string("Round watchdog unavailable, running without deadline: ") + e.what());
            }
        }
    }

    ~RoundWatchdog() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

private:
    void loop() {
        auto start = std::chrono::steady_clock::now();
        std::unique_lock<std::mutex> lock(mu_);
        while (!done_) {
            if (is_cancelled(upstream_)) {
                target_.cancel();
                return;
            }
            if (deadline_ms_ > 0 &&
                std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(deadline_ms_)) {
                log_line("Round deadline of " + std::to_string(deadline_ms_) + " ms reached; cancelling transfers");
                target_.cancel();
                return;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(50), [this] { return done_; });
        }
    }

    CancelToken& target_;
    const CancelToken* upstream_;
    int deadline_ms_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread thread_;
};

TransferProtocol task_protocol(int slot, int tcp_count) {
    return slot < tcp_count ? TransferProtocol::TCP : TransferProtocol::UDP;
}

// Ids run from 1 within each protocol.
int task_id(int slot, int tcp_count) {
    return slot < tcp_count ? slot + 1 : slot - tcp_count + 1;
}

} // namespace

SpeedTestClient::SpeedTestClient(const SpeedTestClientArgs& args) : A(args) {}

void SpeedTestClient::validate(uint64_t requested_size, int tcp_count, int udp_count) const {
    if (requested_size == 0) {
        throw std::invalid_argument("requested size must be positive");
    }
    if (tcp_count < 0 || udp_count < 0) {
        throw std::invalid_argument("connection counts must be non-negative");
    }
    if (tcp_count == 0 && udp_count == 0) {
        throw std::invalid_argument("at least one TCP or UDP connection is required");
    }
    if ((long long)tcp_count + udp_count > A.max_tasks) {
        throw std::invalid_argument("at most " + std::to_string(A.max_tasks) + " connections per round");
    }
}

RoundReport SpeedTestClient::run(const ServerEndpoint& server, uint64_t requested_size,
                                 int tcp_count, int udp_count) {
    validate(requested_size, tcp_count, udp_count);

    log_line("Starting round against " + server.label() + ": " + std::to_string(requested_size) +
             " bytes, " + std::to_string(tcp_count) + " TCP, " + std::to_string(udp_count) + " UDP");

    ResultCollector collector;
    CancelToken round_cancel;
    RoundWatchdog watchdog(round_cancel, A.cancel, A.round_deadline_ms);

    const int total = tcp_count + udp_count;
    StartGate start_gate;

    std::vector<std::thread> workers;
    workers.reserve(total);

    int spawned = 0;
    std::string spawn_error;
    for (; spawned < total; ++spawned) {
        TransferProtocol proto = task_protocol(spawned, tcp_count);
        int id = task_id(spawned, tcp_count);
        try {
            workers.emplace_back([&, proto, id] {
                start_gate.wait(); // synchronized start
                run_task(server, proto, id, requested_size, round_cancel, collector);
            });
        } catch (const std::system_error& e) {
            spawn_error = std::string("could not start task thread: ") + e.what();
            break;
        }
    }

    if (spawned < total) {
        log_line("[Client] Started " + std::to_string(spawned) + " of " + std::to_string(total) +
                 " tasks: " + spawn_error);
        for (int i = spawned; i < total; ++i) {
            TransferFailure f;
            f.id = task_id(i, tcp_count);
            f.protocol = task_protocol(i, tcp_count);
            f.error = spawn_error;
            collector.add_failure(f);
        }
    }
    start_gate.open();

    for (auto& t : workers) t.join();

    RoundReport report;
    report.results = collector.results();
    report.failures = collector.failures();
    report.summary = aggregate(report.results);

    log_line("Round complete: " + std::to_string(report.results.size()) + " succeeded, " +
             std::to_string(report.failures.size()) + " failed");
    return report;
}

void SpeedTestClient::run_task(const ServerEndpoint& server, TransferProtocol proto, int id,
                               uint64_t requested_size, const CancelToken& round_cancel,
                               ResultCollector& collector) {
    TransferResult result;
    std::string err;
    bool ok = false;

    try {
        if (proto == TransferProtocol::TCP) {
            TcpTransfer t(server, A.tcp);
            ok = t.run(id, requested_size, result, err, &round_cancel);
        } else {
            UdpTransfer t(server, A.udp);
            ok = t.run(id, requested_size, result, err, &round_cancel);
        }
    } catch (const std::exception& e) {
        ok = false;
        err = e.what();
    }

    if (ok) {
        collector.add(result);
        return;
    }

    TransferFailure f;
    f.id = id;
    f.protocol = proto;
    f.error = err.empty() ? "unknown error" : err;
    log_line(std::string("[Client] ") + protocol_name(proto) + " transfer #" + std::to_string(id) +
             " failed: " + f.error);
    collector.add_failure(f);
}
