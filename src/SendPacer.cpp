#include "SendPacer.h"

#include <algorithm>
#include <thread>

using Clock = std::chrono::steady_clock;

SendPacer::SendPacer(double pps)
    : rate_pps_(pps > 0.0 ? pps : 0.0),
      unlimited_(pps <= 0.0),
      // 5 ms burst window absorbs scheduler jitter
      capacity_(std::max(1.0, rate_pps_ * 0.005)),
      tokens_(capacity_),
      last_refill_ns_(now_ns()) {}

bool SendPacer::can_send() {
    if (unlimited_) return true;
    refill(now_ns());
    return tokens_ >= 1.0 - 1e-12;
}

void SendPacer::record_send() {
    if (unlimited_) return;
    refill(now_ns());
    tokens_ = std::max(0.0, tokens_ - 1.0);
}

uint64_t SendPacer::next_send_delay_ns() const {
    if (unlimited_) return 0;
    uint64_t now = now_ns();
    double tokens_at_now = tokens_;
    if (now > last_refill_ns_) {
        double delta_s = static_cast<double>(now - last_refill_ns_) / 1e9;
        tokens_at_now = std::min(capacity_, tokens_at_now + rate_pps_ * delta_s);
    }
    if (tokens_at_now >= 1.0) return 0;
    double wait_s = (1.0 - tokens_at_now) / rate_pps_;
    return static_cast<uint64_t>(wait_s * 1e9);
}

void SendPacer::wait_and_record() {
    if (unlimited_) return;
    while (!can_send()) {
        uint64_t wait = next_send_delay_ns();
        if (wait > 0) std::this_thread::sleep_for(std::chrono::nanoseconds(wait));
    }
    record_send();
}

uint64_t SendPacer::now_ns() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     Clock::now().time_since_epoch())
                                     .count());
}

void SendPacer::refill(uint64_t now) {
    if (now <= last_refill_ns_) return;
    double delta_s = static_cast<double>(now - last_refill_ns_) / 1e9;
    tokens_ = std::min(capacity_, tokens_ + rate_pps_ * delta_s);
    last_refill_ns_ = now;
}
