#include "TransferStats.h"

#include <iomanip>
#include <sstream>

const char* protocol_name(TransferProtocol p) {
    return p == TransferProtocol::TCP ? "TCP" : "UDP";
}

double bits_per_second(uint64_t bytes, double elapsed_seconds) {
    if (elapsed_seconds < kMinElapsedSeconds) elapsed_seconds = kMinElapsedSeconds;
    return static_cast<double>(bytes) * 8.0 / elapsed_seconds;
}

double TransferResult::loss_rate() const {
    if (protocol != TransferProtocol::UDP || packets_expected == 0) return 0.0;
    if (packets_received >= packets_expected) return 0.0;
    return 1.0 - static_cast<double>(packets_received) / static_cast<double>(packets_expected);
}

Summary aggregate(const std::vector<TransferResult>& results) {
    Summary s;
    double tcp_bps = 0.0, udp_bps = 0.0, udp_loss = 0.0;

    for (const auto& r : results) {
        if (r.protocol == TransferProtocol::TCP) {
            tcp_bps += r.bits_per_second;
            s.tcp_count++;
        } else {
            udp_bps += r.bits_per_second;
            udp_loss += r.loss_rate();
            s.udp_count++;
        }
    }

    if (s.tcp_count > 0) s.avg_tcp_bps = tcp_bps / s.tcp_count;
    if (s.udp_count > 0) {
        s.avg_udp_bps = udp_bps / s.udp_count;
        s.avg_udp_loss_rate = udp_loss / s.udp_count;
    }
    return s;
}

void ResultCollector::add(const TransferResult& r) {
    std::lock_guard<std::mutex> lock(mu_);
    results_.push_back(r);
}

void ResultCollector::add_failure(const TransferFailure& f) {
    std::lock_guard<std::mutex> lock(mu_);
    failures_.push_back(f);
}

std::vector<TransferResult> ResultCollector::results() const {
    std::lock_guard<std::mutex> lock(mu_);
    return results_;
}

std::vector<TransferFailure> ResultCollector::failures() const {
    std::lock_guard<std::mutex> lock(mu_);
    return failures_;
}

std::string format_bps(double bps) {
    static const char* units[] = {"bit/s", "Kbit/s", "Mbit/s", "Gbit/s"};
    int u = 0;
    while (bps >= 1000.0 && u < 3) {
        bps /= 1000.0;
        ++u;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << bps << " " << units[u];
    return oss.str();
}
