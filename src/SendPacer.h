#pragma once

#include <chrono>
#include <cstdint>

// Token-bucket packet pacer. Not thread-safe: each sender owns its own.
class SendPacer {
public:
    // pps == 0 disables pacing.
    explicit SendPacer(double pps);

    // True when a packet may go out now.
    bool can_send();

    // Consume one token.
    void record_send();

    // Nanoseconds until the next token is available (0 == send now).
    uint64_t next_send_delay_ns() const;

    // Block the calling thread until a packet may be sent, then consume a token.
    void wait_and_record();

    bool unlimited() const { return unlimited_; }

private:
    static uint64_t now_ns();
    void refill(uint64_t now);

    double rate_pps_;
    bool unlimited_;
    double capacity_;
    double tokens_;
    uint64_t last_refill_ns_;
};
