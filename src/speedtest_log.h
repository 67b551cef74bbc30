#pragma once

#include <string>

// Write one line to stderr. Lines from concurrent threads never interleave.
void log_line(const std::string& msg);

// perror() equivalent: "<what>: <strerror(errno)>".
void log_errno(const std::string& what);

// Per-datagram and per-segment chatter, only emitted when verbose.
void log_debug(const std::string& msg);

void set_log_verbose(bool on);
