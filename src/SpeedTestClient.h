#pragma once

#include "CancelToken.h"
#include "TcpTransfer.h"
#include "TransferStats.h"
#include "UdpTransfer.h"
#include "speedtest_protocol.h"

#include <cstdint>
#include <vector>

struct SpeedTestClientArgs {
    TcpTransferArgs tcp;
    UdpTransferArgs udp;
    int max_tasks = 1024;            // upper bound on tcp_count + udp_count
    int round_deadline_ms = 0;       // cancel every task after this long (0 = none)
    const CancelToken* cancel = nullptr;   // external cancellation, e.g. a signal handler
};

struct RoundReport {
    std::vector<TransferResult> results;     // successful transfers, completion order
    std::vector<TransferFailure> failures;   // isolated per-task connection failures
    Summary summary;
};

// Runs one round of concurrent transfers against a discovered server.
class SpeedTestClient {
public:
    explicit SpeedTestClient(const SpeedTestClientArgs& args);

    // Throws std::invalid_argument for a zero size, negative counts, no tasks at
    // all, or more than max_tasks tasks.
    void validate(uint64_t requested_size, int tcp_count, int udp_count) const;

    // Validates first, so nothing touches the network for a bad configuration.
    // A task whose thread cannot be started is reported as a failure.
    RoundReport run(const ServerEndpoint& server, uint64_t requested_size,
                    int tcp_count, int udp_count);

private:
    void run_task(const ServerEndpoint& server, TransferProtocol proto, int id,
                  uint64_t requested_size, const CancelToken& round_cancel,
                  ResultCollector& collector);

private:
    SpeedTestClientArgs A;
};
