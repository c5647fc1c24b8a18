#include "logging/capture_writer.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>

#include <lz4frame.h>

namespace rawinput {

CaptureWriter::CaptureWriter(const char* filename)
    : file_(nullptr)
    , ctx_(nullptr)
    , bytes_in_(0)
    , bytes_out_(0)
{
    file_ = std::fopen(filename, "wb");
    if (!file_) {
        std::perror(filename);
        return;
    }
    std::setvbuf(file_, file_buf_, _IOFBF, sizeof(file_buf_));

    LZ4F_errorCode_t err = LZ4F_createCompressionContext(&ctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        std::fprintf(stderr, "  [CAPTURE] LZ4 context creation failed: %s\n",
                     LZ4F_getErrorName(err));
        ctx_ = nullptr;
        std::fclose(file_);
        file_ = nullptr;
        return;
    }

    // Worst case for one slice, also covers the frame header and end mark
    out_buf_.resize(LZ4F_compressBound(SLICE_SIZE, nullptr) + LZ4F_HEADER_SIZE_MAX);

    size_t hdr_sz = LZ4F_compressBegin(ctx_, out_buf_.data(), out_buf_.size(), nullptr);
    if (LZ4F_isError(hdr_sz)) {
        std::fprintf(stderr, "  [CAPTURE] LZ4 compressBegin error: %s\n",
                     LZ4F_getErrorName(hdr_sz));
        LZ4F_freeCompressionContext(ctx_);
        ctx_ = nullptr;
        std::fclose(file_);
        file_ = nullptr;
        return;
    }
    if (flush_out(hdr_sz) != Status::OK) {
        LZ4F_freeCompressionContext(ctx_);
        ctx_ = nullptr;
        std::fclose(file_);
        file_ = nullptr;
    }
}

CaptureWriter::~CaptureWriter() {
    close();
}

Status CaptureWriter::flush_out(size_t n) {
    if (n == 0) return Status::OK;
    if (std::fwrite(out_buf_.data(), 1, n, file_) != n) {
        std::fprintf(stderr, "  [CAPTURE] write failed: %s\n", strerror(errno));
        return Status::IO_ERROR;
    }
    bytes_out_ += n;
    return Status::OK;
}

Status CaptureWriter::write(const uint8_t* data, size_t len) {
    if (!file_ || !ctx_) return Status::IO_ERROR;

    size_t done = 0;
    while (done < len) {
        size_t slice = len - done;
        if (slice > SLICE_SIZE) slice = SLICE_SIZE;

        size_t n = LZ4F_compressUpdate(ctx_, out_buf_.data(), out_buf_.size(),
                                       data + done, slice, nullptr);
        if (LZ4F_isError(n)) {
            std::fprintf(stderr, "  [CAPTURE] LZ4 compressUpdate error: %s\n",
                         LZ4F_getErrorName(n));
            return Status::COMPRESSION_ERROR;
        }
        Status st = flush_out(n);
        if (st != Status::OK) return st;
        done += slice;
    }

    bytes_in_ += len;
    return Status::OK;
}

Status CaptureWriter::close() {
    if (!file_) return Status::OK;

    Status result = Status::OK;
    if (ctx_) {
        size_t n = LZ4F_compressEnd(ctx_, out_buf_.data(), out_buf_.size(), nullptr);
        if (LZ4F_isError(n)) {
            std::fprintf(stderr, "  [CAPTURE] LZ4 compressEnd error: %s\n",
                         LZ4F_getErrorName(n));
            result = Status::COMPRESSION_ERROR;
        } else {
            result = flush_out(n);
        }
        LZ4F_freeCompressionContext(ctx_);
        ctx_ = nullptr;
    }

    if (std::fclose(file_) != 0 && result == Status::OK) {
        result = Status::IO_ERROR;
    }
    file_ = nullptr;
    return result;
}

} // namespace rawinput
