#include "rawinput/packet.hpp"

#include <cstring>

#include <arpa/inet.h>

namespace rawinput {

// Every multi-byte field is big-endian on the wire.

static size_t put_u16(uint8_t* dst, uint16_t v) {
    uint16_t be = htons(v);
    std::memcpy(dst, &be, 2);
    return 2;
}

static size_t put_i16(uint8_t* dst, int16_t v) {
    return put_u16(dst, static_cast<uint16_t>(v));
}

static size_t put_i32(uint8_t* dst, int32_t v) {
    uint32_t be = htonl(static_cast<uint32_t>(v));
    std::memcpy(dst, &be, 4);
    return 4;
}

static uint16_t get_u16(const uint8_t* src) {
    uint16_t be;
    std::memcpy(&be, src, 2);
    return ntohs(be);
}

static int32_t get_i32(const uint8_t* src) {
    uint32_t be;
    std::memcpy(&be, src, 4);
    return static_cast<int32_t>(ntohl(be));
}

// Common 40-byte prefix shared by data and forceout packets
static size_t pack_header(uint8_t* dst, const PacketHeader& h) {
    size_t off = 0;
    off += put_u16(dst + off, PACKET_MAGIC);
    off += put_i16(dst + off, h.nsamp);
    std::memcpy(dst + off, h.seedname.data(), SEEDNAME_LEN);
    off += SEEDNAME_LEN;
    off += put_i16(dst + off, h.year);
    off += put_i16(dst + off, h.doy);
    off += put_i16(dst + off, h.rate_mantissa);
    off += put_i16(dst + off, h.rate_divisor);
    dst[off++] = h.flags.activity;
    dst[off++] = h.flags.io_clock;
    dst[off++] = h.flags.quality;
    dst[off++] = h.flags.timing_quality;
    off += put_i32(dst + off, h.secs);
    off += put_i32(dst + off, h.usecs);
    off += put_i32(dst + off, h.sequence);
    return off;
}

PacketHeader make_header(const SeedName& seedname, int64_t start_us,
                         RateCode rate, const QualityFlags& flags,
                         int32_t sequence) {
    TimeFields t = split_time(start_us);

    PacketHeader h{};
    h.nsamp = 0;
    h.seedname = seedname;
    h.year = t.year;
    h.doy = t.doy;
    h.rate_mantissa = rate.mantissa;
    h.rate_divisor = rate.divisor;
    h.flags = flags;
    h.secs = t.secs;
    h.usecs = t.usecs;
    h.sequence = sequence;
    return h;
}

void encode_tag(std::vector<uint8_t>& out, const std::string& tag,
                int32_t sequence) {
    out.assign(HEADER_SIZE, 0);
    uint8_t* dst = out.data();

    size_t off = 0;
    off += put_u16(dst + off, PACKET_MAGIC);
    off += put_i16(dst + off, NSAMP_TAG);

    for (size_t i = 0; i < SEEDNAME_LEN; ++i) {
        dst[off + i] = (i < tag.size()) ? static_cast<uint8_t>(tag[i]) : ' ';
    }
    off += SEEDNAME_LEN;

    // Six int32 slots; only the last (the header's sequence offset) is used
    put_i32(dst + off + 5 * 4, sequence);
}

void encode_forceout(std::vector<uint8_t>& out, const PacketHeader& hdr) {
    PacketHeader h = hdr;
    h.nsamp = NSAMP_FORCEOUT;
    h.rate_mantissa = 0;
    h.rate_divisor = 0;

    out.resize(HEADER_SIZE);
    pack_header(out.data(), h);
}

Status encode_data(std::vector<uint8_t>& out, const PacketHeader& hdr,
                   const int32_t* samples, size_t count) {
    if (count == 0 || count > static_cast<size_t>(MAX_PACKET_SAMPLES)) {
        return Status::PAYLOAD_TOO_LARGE;
    }

    PacketHeader h = hdr;
    h.nsamp = static_cast<int16_t>(count);

    out.resize(data_packet_size(count));
    uint8_t* dst = out.data();
    size_t off = pack_header(dst, h);
    for (size_t i = 0; i < count; ++i) {
        off += put_i32(dst + off, samples[i]);
    }
    return Status::OK;
}

Status decode_header(const uint8_t* src, size_t len, PacketHeader& out) {
    if (len < HEADER_SIZE) return Status::TRUNCATED;
    if (get_u16(src) != PACKET_MAGIC) return Status::BAD_MAGIC;

    size_t off = 2;
    out.nsamp = static_cast<int16_t>(get_u16(src + off));
    off += 2;
    std::memcpy(out.seedname.data(), src + off, SEEDNAME_LEN);
    off += SEEDNAME_LEN;

    if (out.nsamp == NSAMP_TAG) {
        // Tag packets carry no time or rate; only the trailing slot is used
        out.year = out.doy = out.rate_mantissa = out.rate_divisor = 0;
        out.flags = QualityFlags{};
        out.secs = out.usecs = 0;
        out.sequence = get_i32(src + HEADER_SIZE - 4);
        return Status::OK;
    }

    out.year = static_cast<int16_t>(get_u16(src + off));          off += 2;
    out.doy = static_cast<int16_t>(get_u16(src + off));           off += 2;
    out.rate_mantissa = static_cast<int16_t>(get_u16(src + off)); off += 2;
    out.rate_divisor = static_cast<int16_t>(get_u16(src + off));  off += 2;
    out.flags.activity = src[off++];
    out.flags.io_clock = src[off++];
    out.flags.quality = src[off++];
    out.flags.timing_quality = src[off++];
    out.secs = get_i32(src + off);     off += 4;
    out.usecs = get_i32(src + off);    off += 4;
    out.sequence = get_i32(src + off);
    return Status::OK;
}

size_t packet_size(const PacketHeader& hdr) {
    if (hdr.nsamp > 0) return data_packet_size(static_cast<size_t>(hdr.nsamp));
    return HEADER_SIZE;
}

void decode_samples(const uint8_t* payload, size_t count, int32_t* out) {
    for (size_t i = 0; i < count; ++i) {
        out[i] = get_i32(payload + i * 4);
    }
}

} // namespace rawinput
