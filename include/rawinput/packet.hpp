#pragma once

#include "rawinput/rate_codec.hpp"
#include "rawinput/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rawinput {

// Wire size of a data packet carrying `nsamp` samples
inline constexpr size_t data_packet_size(size_t nsamp) {
    return HEADER_SIZE + nsamp * 4;
}

// Fill a header for a chunk starting at `start_us`. nsamp is left 0;
// the encoders set it.
PacketHeader make_header(const SeedName& seedname, int64_t start_us,
                         RateCode rate, const QualityFlags& flags,
                         int32_t sequence);

// Tag packet (nsamp = -1), always HEADER_SIZE bytes. The tag is space padded
// and cut to 12 bytes; callers validate the 10 character limit first.
// `sequence` lands in the last int32 slot, zero for a normal session open.
void encode_tag(std::vector<uint8_t>& out, const std::string& tag,
                int32_t sequence = 0);

// Forceout packet (nsamp = -2): header only, rate fields zeroed.
void encode_forceout(std::vector<uint8_t>& out, const PacketHeader& hdr);

// Data packet: header with nsamp = count, then count int32 samples.
// PAYLOAD_TOO_LARGE if count is 0 or above MAX_PACKET_SAMPLES.
Status encode_data(std::vector<uint8_t>& out, const PacketHeader& hdr,
                   const int32_t* samples, size_t count);

// Parse the 40-byte header at src. TRUNCATED if len < HEADER_SIZE,
// BAD_MAGIC if the sentinel does not match.
Status decode_header(const uint8_t* src, size_t len, PacketHeader& out);

// Full wire size of a packet given its decoded header
size_t packet_size(const PacketHeader& hdr);

// Decode `count` big-endian int32 samples following a data header
void decode_samples(const uint8_t* payload, size_t count, int32_t* out);

} // namespace rawinput
