#pragma once

#include "CancelToken.h"
#include "TransferStats.h"
#include "speedtest_protocol.h"

#include <cstdint>
#include <string>

struct TcpTransferArgs {
    int connect_timeout_ms = 3000;   // non-blocking connect bound
    int idle_timeout_ms = 10000;     // no bytes for this long ends the transfer as partial
    int poll_ms = 100;               // granularity of cancellation checks
    int rcvbuf = 4 * 1024 * 1024;    // receive buffer size
};

// Client side of one TCP transfer: connect, send "<size>\n", count bytes until
// the requested amount arrives or the server closes.
class TcpTransfer {
public:
    TcpTransfer(const ServerEndpoint& server, const TcpTransferArgs& args);
    ~TcpTransfer();

    TcpTransfer(const TcpTransfer&) = delete;
    TcpTransfer& operator=(const TcpTransfer&) = delete;

    // Returns false on a connection failure and fills `err`. A short transfer is
    // still a success with fewer bytes in `out`.
    bool run(int id, uint64_t requested_size, TransferResult& out, std::string& err,
             const CancelToken* cancel = nullptr);

private:
    bool connect_with_timeout(std::string& err);
    bool send_request(uint64_t requested_size, std::string& err);

private:
    ServerEndpoint server;
    TcpTransferArgs A;
    int fd = -1;
};
