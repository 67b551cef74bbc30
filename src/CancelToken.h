#pragma once

#include <atomic>

// Cooperative cancellation. Blocking loops check it between receive attempts.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancelToken* t) {
    return t != nullptr && t->cancelled();
}
