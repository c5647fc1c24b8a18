#pragma once

#include "rawinput/types.hpp"
#include "streaming/chunk_planner.hpp"
#include "streaming/connection.hpp"
#include "streaming/socket_ops.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rawinput {

class CaptureWriter;

struct SenderConfig {
    std::string  host = "127.0.0.1";
    int          port = 0;
    std::string  tag;
    QualityFlags flags;
};

// One named, rate-tagged channel of integer samples
struct ChannelData {
    ChannelIdentity      id;
    double               rate = 0.0;
    int64_t              start_us = 0;
    std::vector<int32_t> samples;
};

// Outcome of one channel send. On failure `confirmed` lists the chunks the
// collector already has, so a retry can resume after the last of them.
struct SendResult {
    Status             status = Status::OK;
    std::string        error;
    std::vector<Chunk> confirmed;
    bool               forceout_sent = false;
    uint64_t           bytes_sent = 0;
    int32_t            next_sequence = 0;

    bool ok() const { return status == Status::OK; }
    bool partial() const { return status != Status::OK && !confirmed.empty(); }
    size_t samples_confirmed() const;
};

// Pushes whole channels to the collector: data packets for each one-minute
// chunk, then a forceout so the collector publishes without waiting.
//
// The sequence counter belongs to the sender and restarts at 0 whenever it
// starts using a different connection; every data or forceout packet takes
// exactly one number. The tag packet takes none.
class StreamSender {
public:
    explicit StreamSender(const SenderConfig& cfg,
                          SocketOps& ops = default_socket_ops());

    StreamSender(const StreamSender&) = delete;
    StreamSender& operator=(const StreamSender&) = delete;

    // Recorded by connections this sender opens in send_stream()
    void set_capture(CaptureWriter* c) { capture_ = c; }

    // Opens `conn` first if it is still UNOPENED. Tag, seed name and rate are
    // validated before any network activity. Does not close `conn`.
    SendResult send_channel(const ChannelIdentity& id, double rate,
                            int64_t start_us, const int32_t* samples,
                            size_t count, Connection& conn);

    SendResult send_channel(const ChannelData& ch, Connection& conn) {
        return send_channel(ch.id, ch.rate, ch.start_us,
                            ch.samples.data(), ch.samples.size(), conn);
    }

    // One fresh connection per channel, always closed afterwards. A failed
    // channel does not stop the rest.
    std::vector<SendResult> send_stream(const std::vector<ChannelData>& channels);

    int32_t sequence() const { return sequence_; }
    const SenderConfig& config() const { return cfg_; }

private:
    Status validate(const ChannelIdentity& id, double rate, SeedName& seedname,
                    std::string& err) const;

    SenderConfig cfg_;
    SocketOps& ops_;
    CaptureWriter* capture_ = nullptr;

    int32_t sequence_;
    uint64_t seq_conn_id_;  // Connection::id() sequence_ counts for, 0 = none
};

} // namespace rawinput
