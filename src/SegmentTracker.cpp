#include "SegmentTracker.h"

bool SegmentTracker::record(uint64_t total, uint64_t index, size_t bytes) {
    if (!has_total_ || total != total_) {
        total_ = total;
        has_total_ = true;
        in_range_ = 0;
        in_range_bytes_ = 0;
        for (const auto& seg : seen_) {
            if (seg.first < total_) {
                ++in_range_;
                in_range_bytes_ += seg.second;
            }
        }
    }
    bool fresh = seen_.emplace(index, bytes).second;
    if (fresh && index < total_) {
        ++in_range_;
        in_range_bytes_ += bytes;
    }
    return fresh;
}

bool SegmentTracker::complete() const {
    return has_total_ && in_range_ >= total_;
}

double SegmentTracker::loss_rate() const {
    if (!has_total_) return 1.0;
    if (total_ == 0) return 0.0;
    return 1.0 - static_cast<double>(in_range_) / static_cast<double>(total_);
}

void SegmentTracker::reset() {
    seen_.clear();
    total_ = 0;
    in_range_ = 0;
    in_range_bytes_ = 0;
    has_total_ = false;
}
