#include "speedtest_log.h"

#include <errno.h>

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mu;
std::atomic<bool> g_verbose{false};

} // namespace

void log_line(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mu);
    std::cerr << msg << "\n";
}

void log_errno(const std::string& what) {
    int err = errno;
    log_line(what + ": " + std::strerror(err));
}

void log_debug(const std::string& msg) {
    if (g_verbose.load(std::memory_order_relaxed)) log_line(msg);
}

void set_log_verbose(bool on) {
    g_verbose.store(on);
}
