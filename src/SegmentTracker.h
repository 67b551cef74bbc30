#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>

// Unique segment indices seen by one UDP transfer.
class SegmentTracker {
public:
    // Record a Payload header and its data length. Returns true when `index` had
    // not been seen before. `total` replaces any earlier declared total.
    bool record(uint64_t total, uint64_t index, size_t bytes = 0);

    bool has_total() const { return has_total_; }
    uint64_t total() const { return total_; }

    // Unique indices inside [0, total).
    uint64_t unique_received() const { return in_range_; }

    // Data bytes carried by those segments.
    uint64_t unique_bytes() const { return in_range_bytes_; }

    bool complete() const;

    // 1 - unique/total, or 1 when no total is known.
    double loss_rate() const;

    void reset();

private:
    std::unordered_map<uint64_t, size_t> seen_;   // index -> data bytes
    uint64_t total_ = 0;
    uint64_t in_range_ = 0;         // members of seen_ below total_
    uint64_t in_range_bytes_ = 0;
    bool has_total_ = false;
};
