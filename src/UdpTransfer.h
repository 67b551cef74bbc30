#pragma once

#include "CancelToken.h"
#include "SegmentTracker.h"
#include "TransferStats.h"
#include "speedtest_protocol.h"

#include <netinet/in.h>

#include <cstdint>
#include <string>

struct UdpTransferArgs {
    int recv_timeout_ms = 1000;      // silence this long ends the transfer
    int max_ms = 30000;              // wall-clock cap for one transfer (0 = none)
    int poll_ms = 100;               // granularity of cancellation checks
    int rcvbuf = 4 * 1024 * 1024;    // receive buffer size
    bool resend_request = true;      // re-send the Request once if the server stays silent
};

// Client side of one UDP transfer: send a Request, collect Payload segments
// until all arrived, the stream goes quiet, or the cap elapses.
class UdpTransfer {
public:
    UdpTransfer(const ServerEndpoint& server, const UdpTransferArgs& args);
    ~UdpTransfer();

    UdpTransfer(const UdpTransfer&) = delete;
    UdpTransfer& operator=(const UdpTransfer&) = delete;

    // Returns false only when the socket cannot be set up or the Request cannot
    // be sent. Loss is reported through `out`, not as a failure.
    bool run(int id, uint64_t requested_size, TransferResult& out, std::string& err,
             const CancelToken* cancel = nullptr);

    const SegmentTracker& tracker() const { return tracker_; }
    uint64_t duplicates() const { return duplicates_; }

private:
    bool init(std::string& err);
    bool send_request(uint64_t requested_size, std::string& err);

private:
    ServerEndpoint server;
    UdpTransferArgs A;
    int fd = -1;
    sockaddr_in dest{};
    SegmentTracker tracker_;
    uint64_t duplicates_ = 0;
};
