#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class TransferProtocol { TCP, UDP };

const char* protocol_name(TransferProtocol p);

// Substituted for elapsed time when a transfer completes faster than the clock resolves.
constexpr double kMinElapsedSeconds = 0.001;

double bits_per_second(uint64_t bytes, double elapsed_seconds);

struct TransferResult {
    int id = 0;                          // sequential within its protocol, from 1
    TransferProtocol protocol = TransferProtocol::TCP;
    uint64_t requested_size = 0;
    uint64_t bytes_received = 0;
    double elapsed_seconds = 0.0;
    double bits_per_second = 0.0;
    uint64_t packets_expected = 0;       // UDP only
    uint64_t packets_received = 0;       // UDP only, unique segments

    // 1 - received/expected for UDP; 0 for TCP or when nothing was expected.
    double loss_rate() const;
};

struct TransferFailure {
    int id = 0;
    TransferProtocol protocol = TransferProtocol::TCP;
    std::string error;
};

struct Summary {
    std::optional<double> avg_tcp_bps;
    std::optional<double> avg_udp_bps;
    std::optional<double> avg_udp_loss_rate;
    size_t tcp_count = 0;
    size_t udp_count = 0;
};

// Averages per protocol. A protocol without results leaves its fields empty.
Summary aggregate(const std::vector<TransferResult>& results);

// Append-only store shared by concurrent transfer tasks.
class ResultCollector {
public:
    void add(const TransferResult& r);
    void add_failure(const TransferFailure& f);

    std::vector<TransferResult> results() const;
    std::vector<TransferFailure> failures() const;

private:
    mutable std::mutex mu_;
    std::vector<TransferResult> results_;
    std::vector<TransferFailure> failures_;
};

// "12.34 Mbit/s" style rendering.
std::string format_bps(double bps);
