#pragma once

#include "CancelToken.h"
#include "speedtest_protocol.h"

#include <cstdint>
#include <optional>

struct OfferListenerArgs {
    uint16_t port = kDiscoveryPort;   // well-known discovery port to bind
    int poll_ms = 250;                // receive timeout between cancellation checks
};

class OfferListener {
public:
    explicit OfferListener(const OfferListenerArgs& args);
    ~OfferListener();

    OfferListener(const OfferListener&) = delete;
    OfferListener& operator=(const OfferListener&) = delete;

    bool init();

    // Block until a valid Offer arrives. timeout_ms == 0 waits forever.
    // Returns nullopt on cancellation, timeout or a socket error.
    std::optional<ServerEndpoint> wait_for_offer(const CancelToken* cancel = nullptr,
                                                 int timeout_ms = 0);

    uint16_t local_port() const;

private:
    OfferListenerArgs A;
    int fd = -1;
};
