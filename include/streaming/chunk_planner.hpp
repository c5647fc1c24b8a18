#pragma once

#include "rawinput/types.hpp"

#include <cstddef>
#include <cstdint>

namespace rawinput {

constexpr double CHUNK_SECONDS = 60.0;

struct Chunk {
    size_t  index;      // 0-based position in the trace's chunk sequence
    size_t  offset;     // first sample of the chunk
    size_t  count;
    int64_t start_us;   // time of the first sample
};

// Splits a trace into one-minute windows of round(rate * 60) samples,
// clamped to [1, max_samples]. The last window takes whatever is left.
// Single pass: once next() returns false the planner is spent.
class ChunkPlanner {
public:
    ChunkPlanner(size_t total_samples, double rate, int64_t start_us,
                 size_t max_samples = MAX_PACKET_SAMPLES);

    bool next(Chunk& out);

    size_t window() const { return window_; }
    size_t remaining() const { return total_ - offset_; }

private:
    size_t  total_;
    double  rate_;
    int64_t start_us_;
    size_t  window_;
    size_t  offset_;
    size_t  index_;
};

} // namespace rawinput
