#include "logging/capture_reader.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>

#include <lz4frame.h>

namespace rawinput {

CaptureReader::CaptureReader(const char* filename)
    : file_(nullptr)
    , ctx_(nullptr)
{
    file_ = std::fopen(filename, "rb");
    if (!file_) {
        std::perror(filename);
        return;
    }

    LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        std::fprintf(stderr, "  [CAPTURE] LZ4 context creation failed: %s\n",
                     LZ4F_getErrorName(err));
        ctx_ = nullptr;
    }
}

CaptureReader::~CaptureReader() {
    if (ctx_) LZ4F_freeDecompressionContext(ctx_);
    if (file_) std::fclose(file_);
}

Status CaptureReader::read_all(std::vector<uint8_t>& out) {
    if (!is_open()) return Status::IO_ERROR;

    out.clear();
    uint8_t in_buf[64 * 1024];
    uint8_t dec_buf[256 * 1024];
    size_t hint = 1;  // nonzero until LZ4F reports the frame is complete

    while (hint != 0) {
        size_t got = std::fread(in_buf, 1, sizeof(in_buf), file_);
        if (got == 0) {
            if (std::ferror(file_)) {
                std::fprintf(stderr, "  [CAPTURE] read failed: %s\n", strerror(errno));
                return Status::IO_ERROR;
            }
            std::fprintf(stderr, "  [CAPTURE] capture ends mid-frame\n");
            return Status::TRUNCATED;
        }

        // Keep calling while input remains or the output buffer came back
        // full (LZ4F may still hold decoded bytes)
        size_t pos = 0;
        size_t dst_sz = 0;
        do {
            size_t src_sz = got - pos;
            dst_sz = sizeof(dec_buf);
            hint = LZ4F_decompress(ctx_, dec_buf, &dst_sz,
                                   in_buf + pos, &src_sz, nullptr);
            if (LZ4F_isError(hint)) {
                std::fprintf(stderr, "  [CAPTURE] LZ4 decompress error: %s\n",
                             LZ4F_getErrorName(hint));
                return Status::COMPRESSION_ERROR;
            }
            out.insert(out.end(), dec_buf, dec_buf + dst_sz);
            pos += src_sz;
        } while (hint != 0 && (pos < got || dst_sz == sizeof(dec_buf)));
    }

    return Status::OK;
}

} // namespace rawinput
