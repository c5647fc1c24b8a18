#pragma once

#include "rawinput/types.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

typedef struct LZ4F_dctx_s LZ4F_dctx;

namespace rawinput {

// Reads back a capture written by CaptureWriter.
class CaptureReader {
public:
    explicit CaptureReader(const char* filename);
    ~CaptureReader();

    CaptureReader(const CaptureReader&) = delete;
    CaptureReader& operator=(const CaptureReader&) = delete;

    bool is_open() const { return file_ != nullptr && ctx_ != nullptr; }

    // Decompress the whole capture into out (the raw wire byte stream).
    // TRUNCATED if the file ends mid-frame.
    Status read_all(std::vector<uint8_t>& out);

private:
    FILE* file_;
    LZ4F_dctx* ctx_;
};

} // namespace rawinput
