#pragma once

#include "rawinput/types.hpp"
#include "streaming/socket_ops.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rawinput {

class CaptureWriter;

constexpr int    CONNECT_ATTEMPTS   = 3;
constexpr double CONNECT_BACKOFF_SEC = 1.0;

// One TCP session to the collector.
//
//   UNOPENED --open()--> OPEN --close() / send error--> CLOSED
//
// OPEN is only entered after connect succeeded and the tag packet went out.
// CLOSED is terminal; a failed connection is never reopened, callers build a
// new one. Not thread-safe: one sender at a time.
class Connection {
public:
    enum class State { UNOPENED, OPEN, CLOSED };

    explicit Connection(SocketOps& ops = default_socket_ops());
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Optional capture of every byte sent (set before open())
    void set_capture(CaptureWriter* c) { capture_ = c; }

    // Validates the tag, connects with up to CONNECT_ATTEMPTS tries and
    // CONNECT_BACKOFF_SEC between them, then sends the tag packet.
    Status open(const std::string& host, int port, const std::string& tag);

    // Blocking write of the whole buffer. Any socket error closes the
    // connection and returns SEND_FAILED; last_error() has the detail.
    Status send(const uint8_t* data, size_t len);
    Status send(const std::vector<uint8_t>& buf) { return send(buf.data(), buf.size()); }

    // Idempotent
    void close();

    // Unique per object for the life of the process, never 0
    uint64_t id() const { return id_; }

    State state() const { return state_; }
    bool is_open() const { return state_ == State::OPEN; }

    const std::string& last_error() const { return last_error_; }
    const std::string& tag() const { return tag_; }

    struct Stats {
        int      connect_attempts;
        uint64_t packets_sent;   // includes the tag packet
        uint64_t bytes_sent;
    };
    Stats get_stats() const;

private:
    void record(const uint8_t* data, size_t len);

    SocketOps& ops_;
    CaptureWriter* capture_ = nullptr;

    const uint64_t id_;
    State state_;
    int fd_;
    std::string tag_;
    std::string last_error_;

    int      connect_attempts_;
    uint64_t packets_sent_;
    uint64_t bytes_sent_;
};

const char* state_str(Connection::State s);

} // namespace rawinput
