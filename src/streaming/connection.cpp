#include "streaming/connection.hpp"
#include "logging/capture_writer.hpp"
#include "rawinput/packet.hpp"

#include <atomic>
#include <cstdio>

namespace rawinput {

static std::atomic<uint64_t> next_connection_id{1};

Connection::Connection(SocketOps& ops)
    : ops_(ops)
    , id_(next_connection_id.fetch_add(1, std::memory_order_relaxed))
    , state_(State::UNOPENED)
    , fd_(-1)
    , connect_attempts_(0)
    , packets_sent_(0)
    , bytes_sent_(0)
{
}

Connection::~Connection() {
    close();
}

Status Connection::open(const std::string& host, int port, const std::string& tag) {
    if (state_ != State::UNOPENED) {
        last_error_ = std::string("open() on ") + state_str(state_) + " connection";
        return Status::BAD_STATE;
    }
    if (tag.size() > MAX_TAG_LEN) {
        last_error_ = "tag '" + tag + "' longer than 10 characters";
        std::fprintf(stderr, "  [CONN] %s\n", last_error_.c_str());
        return Status::INVALID_TAG;
    }

    int fd = -1;
    for (int attempt = 1; attempt <= CONNECT_ATTEMPTS; ++attempt) {
        connect_attempts_++;
        std::string err;
        fd = ops_.connect(host, port, err);
        if (fd >= 0) break;

        last_error_ = err;
        std::fprintf(stderr, "  [CONN] connect %s:%d attempt %d/%d failed: %s\n",
                     host.c_str(), port, attempt, CONNECT_ATTEMPTS, err.c_str());
        if (attempt < CONNECT_ATTEMPTS) {
            ops_.sleep_sec(CONNECT_BACKOFF_SEC);
        }
    }

    if (fd < 0) {
        state_ = State::CLOSED;
        return Status::CONNECTION_FAILED;
    }

    fd_ = fd;
    tag_ = tag;

    std::vector<uint8_t> buf;
    encode_tag(buf, tag);

    // Not OPEN until the tag is on the wire
    std::string err;
    if (!ops_.send_all(fd_, buf.data(), buf.size(), err)) {
        last_error_ = err;
        std::fprintf(stderr, "  [CONN] tag send to %s:%d failed: %s\n",
                     host.c_str(), port, err.c_str());
        close();
        return Status::SEND_FAILED;
    }
    packets_sent_++;
    bytes_sent_ += buf.size();
    record(buf.data(), buf.size());

    state_ = State::OPEN;
    std::printf("  [CONN] Connected to %s:%d as '%s'\n",
                host.c_str(), port, tag.c_str());
    return Status::OK;
}

Status Connection::send(const uint8_t* data, size_t len) {
    if (state_ != State::OPEN) {
        last_error_ = std::string("send() on ") + state_str(state_) + " connection";
        return Status::NOT_OPEN;
    }

    std::string err;
    if (!ops_.send_all(fd_, data, len, err)) {
        last_error_ = err;
        std::fprintf(stderr, "  [CONN] send failed: %s\n", err.c_str());
        close();
        return Status::SEND_FAILED;
    }

    packets_sent_++;
    bytes_sent_ += len;
    record(data, len);
    return Status::OK;
}

// A broken capture never fails the live stream; it is reported and dropped.
void Connection::record(const uint8_t* data, size_t len) {
    if (!capture_) return;
    if (capture_->write(data, len) != Status::OK) {
        std::fprintf(stderr, "  [CONN] capture write failed, capture disabled\n");
        capture_ = nullptr;
    }
}

void Connection::close() {
    if (fd_ >= 0) {
        ops_.close(fd_);
        fd_ = -1;
    }
    state_ = State::CLOSED;
}

Connection::Stats Connection::get_stats() const {
    Stats s{};
    s.connect_attempts = connect_attempts_;
    s.packets_sent = packets_sent_;
    s.bytes_sent = bytes_sent_;
    return s;
}

const char* state_str(Connection::State s) {
    switch (s) {
        case Connection::State::UNOPENED: return "unopened";
        case Connection::State::OPEN:     return "open";
        case Connection::State::CLOSED:   return "closed";
    }
    return "unknown";
}

} // namespace rawinput
