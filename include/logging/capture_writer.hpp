#pragma once

#include "rawinput/types.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

// Forward declare LZ4F types to avoid including lz4frame.h in header
typedef struct LZ4F_cctx_s LZ4F_cctx;

namespace rawinput {

// Records every byte handed to the collector as one LZ4 frame.
// File opened with fopen + setvbuf; frame header written on open,
// end mark written by close(). Not thread-safe.
class CaptureWriter {
public:
    explicit CaptureWriter(const char* filename);
    ~CaptureWriter();

    CaptureWriter(const CaptureWriter&) = delete;
    CaptureWriter& operator=(const CaptureWriter&) = delete;

    bool is_open() const { return file_ != nullptr; }

    Status write(const uint8_t* data, size_t len);

    // Finish the frame, flush and close. Safe to call twice.
    Status close();

    uint64_t bytes_in() const { return bytes_in_; }
    uint64_t bytes_out() const { return bytes_out_; }

private:
    Status flush_out(size_t n);

    FILE* file_;
    LZ4F_cctx* ctx_;
    std::vector<uint8_t> out_buf_;
    uint64_t bytes_in_;
    uint64_t bytes_out_;

    // Input is fed to LZ4F in slices of this size so out_buf_ stays bounded
    static constexpr size_t SLICE_SIZE = 64 * 1024;

    char file_buf_[256 * 1024];
};

} // namespace rawinput
