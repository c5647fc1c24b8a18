#include "streaming/chunk_planner.hpp"

#include <cmath>

namespace rawinput {

ChunkPlanner::ChunkPlanner(size_t total_samples, double rate, int64_t start_us,
                           size_t max_samples)
    : total_(total_samples)
    , rate_(rate)
    , start_us_(start_us)
    , window_(1)
    , offset_(0)
    , index_(0)
{
    double w = std::round(rate * CHUNK_SECONDS);
    if (std::isfinite(w) && w > 1.0) {
        window_ = (w >= static_cast<double>(max_samples))
                  ? max_samples : static_cast<size_t>(w);
    }
    if (window_ == 0) window_ = 1;
}

bool ChunkPlanner::next(Chunk& out) {
    if (offset_ >= total_) return false;

    size_t count = total_ - offset_;
    if (count > window_) count = window_;

    out.index = index_;
    out.offset = offset_;
    out.count = count;
    // Offset from the trace start, not the previous chunk, so rounding
    // never accumulates
    out.start_us = start_us_ + static_cast<int64_t>(
        std::llround(static_cast<double>(offset_) * 1e6 / rate_));

    offset_ += count;
    index_++;
    return true;
}

} // namespace rawinput
