#include "streaming/stream_sender.hpp"
#include "rawinput/packet.hpp"
#include "rawinput/rate_codec.hpp"

#include <cmath>
#include <cstdio>

namespace rawinput {

size_t SendResult::samples_confirmed() const {
    size_t n = 0;
    for (const auto& c : confirmed) n += c.count;
    return n;
}

StreamSender::StreamSender(const SenderConfig& cfg, SocketOps& ops)
    : cfg_(cfg)
    , ops_(ops)
    , sequence_(0)
    , seq_conn_id_(0)
{
}

Status StreamSender::validate(const ChannelIdentity& id, double rate,
                              SeedName& seedname, std::string& err) const {
    if (cfg_.tag.size() > MAX_TAG_LEN) {
        err = "tag '" + cfg_.tag + "' longer than 10 characters";
        return Status::INVALID_TAG;
    }
    if (!make_seedname(id, seedname)) {
        err = "bad seed name " + id.network + "." + id.station + "." +
              id.channel + "." + id.location;
        return Status::INVALID_SEEDNAME;
    }
    if (!rate_encodable(rate)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "sample rate %g Hz not encodable", rate);
        err = buf;
        return Status::INVALID_RATE;
    }
    return Status::OK;
}

SendResult StreamSender::send_channel(const ChannelIdentity& id, double rate,
                                      int64_t start_us, const int32_t* samples,
                                      size_t count, Connection& conn) {
    SendResult result;

    SeedName seedname;
    result.status = validate(id, rate, seedname, result.error);
    if (result.status != Status::OK) {
        std::fprintf(stderr, "  [SEND] %s\n", result.error.c_str());
        result.next_sequence = sequence_;
        return result;
    }

    const uint64_t bytes_before = conn.get_stats().bytes_sent;

    if (conn.state() == Connection::State::UNOPENED) {
        result.status = conn.open(cfg_.host, cfg_.port, cfg_.tag);
        if (result.status != Status::OK) {
            result.error = conn.last_error();
            result.bytes_sent = conn.get_stats().bytes_sent - bytes_before;
            result.next_sequence = sequence_;
            return result;
        }
        sequence_ = 0;
        seq_conn_id_ = conn.id();
    } else if (seq_conn_id_ != conn.id()) {
        sequence_ = 0;
        seq_conn_id_ = conn.id();
    }

    const RateCode code = encode_rate(rate);
    const std::string name = seedname_str(seedname);
    std::vector<uint8_t> buf;
    buf.reserve(data_packet_size(MAX_PACKET_SAMPLES));

    ChunkPlanner planner(count, rate, start_us);
    Chunk chunk;
    int64_t end_us = start_us;

    while (planner.next(chunk)) {
        PacketHeader hdr = make_header(seedname, chunk.start_us, code,
                                       cfg_.flags, sequence_);
        result.status = encode_data(buf, hdr, samples + chunk.offset, chunk.count);
        if (result.status != Status::OK) {
            result.error = status_str(result.status);
            break;
        }

        result.status = conn.send(buf);
        if (result.status != Status::OK) {
            result.error = conn.last_error();
            std::fprintf(stderr, "  [SEND] '%s' chunk %zu (seq %d) failed after %zu confirmed: %s\n",
                         name.c_str(), chunk.index, sequence_,
                         result.confirmed.size(), result.error.c_str());
            break;
        }
        sequence_++;
        result.confirmed.push_back(chunk);

        end_us = start_us + static_cast<int64_t>(
            std::llround(static_cast<double>(chunk.offset + chunk.count) * 1e6 / rate));
    }

    if (result.status == Status::OK) {
        PacketHeader hdr = make_header(seedname, end_us, code, cfg_.flags, sequence_);
        encode_forceout(buf, hdr);
        result.status = conn.send(buf);
        if (result.status == Status::OK) {
            sequence_++;
            result.forceout_sent = true;
        } else {
            result.error = conn.last_error();
            std::fprintf(stderr, "  [SEND] '%s' forceout failed: %s\n",
                         name.c_str(), result.error.c_str());
        }
    }

    result.bytes_sent = conn.get_stats().bytes_sent - bytes_before;
    result.next_sequence = sequence_;

    if (result.ok()) {
        std::printf("  [SEND] '%s' %zu samples @ %g Hz in %zu packets, %lu bytes\n",
                    name.c_str(), count, rate, result.confirmed.size(),
                    static_cast<unsigned long>(result.bytes_sent));
    }
    return result;
}

std::vector<SendResult> StreamSender::send_stream(const std::vector<ChannelData>& channels) {
    std::vector<SendResult> results;
    results.reserve(channels.size());

    for (const auto& ch : channels) {
        Connection conn(ops_);
        conn.set_capture(capture_);
        results.push_back(send_channel(ch, conn));
        conn.close();
    }

    int failed = 0;
    for (const auto& r : results) {
        if (!r.ok()) failed++;
    }
    if (failed > 0) {
        std::fprintf(stderr, "  [SEND] %d/%zu channels failed\n", failed, results.size());
    }
    return results;
}

} // namespace rawinput
