#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rawinput {

// Wire protocol constants (Edge/CWB RawInputServer)
constexpr uint16_t PACKET_MAGIC       = 0xA1B2;
constexpr int16_t  NSAMP_TAG          = -1;
constexpr int16_t  NSAMP_FORCEOUT     = -2;
constexpr int      MAX_PACKET_SAMPLES = 32767;  // sample count is an int16
constexpr size_t   HEADER_SIZE        = 40;
constexpr size_t   SEEDNAME_LEN       = 12;
constexpr size_t   MAX_TAG_LEN        = 10;

// Seed name field widths: NNSSSSSCCCLL
constexpr size_t NETWORK_LEN  = 2;
constexpr size_t STATION_LEN  = 5;
constexpr size_t CHANNEL_LEN  = 3;
constexpr size_t LOCATION_LEN = 2;

enum class Status {
    OK = 0,
    INVALID_TAG,
    INVALID_SEEDNAME,
    INVALID_RATE,
    PAYLOAD_TOO_LARGE,
    CONNECTION_FAILED,
    SEND_FAILED,
    NOT_OPEN,
    BAD_STATE,
    TRUNCATED,
    BAD_MAGIC,
    IO_ERROR,
    COMPRESSION_ERROR,
};

const char* status_str(Status s);

using SeedName = std::array<char, SEEDNAME_LEN>;

struct ChannelIdentity {
    std::string network;
    std::string station;
    std::string channel;
    std::string location;
};

// Build NNSSSSSCCCLL, each field left-justified and space-padded.
// Returns false if a field is too long or holds a non-printable byte.
bool make_seedname(const ChannelIdentity& id, SeedName& out);

inline std::string seedname_str(const SeedName& s) {
    return std::string(s.data(), s.size());
}

// SEED passthrough flags, copied into every data and forceout header
struct QualityFlags {
    uint8_t activity       = 0;
    uint8_t io_clock       = 0;
    uint8_t quality        = 0;
    uint8_t timing_quality = 0;
};

struct PacketHeader {
    int16_t  nsamp;
    SeedName seedname;
    int16_t  year;
    int16_t  doy;
    int16_t  rate_mantissa;
    int16_t  rate_divisor;
    QualityFlags flags;
    int32_t  secs;      // seconds of day
    int32_t  usecs;
    int32_t  sequence;
};

// Broken-down UTC time as carried in the header
struct TimeFields {
    int16_t year;
    int16_t doy;    // 1-366
    int32_t secs;   // seconds of day
    int32_t usecs;
};

// Split microseconds since the Unix epoch (UTC) into header time fields.
TimeFields split_time(int64_t epoch_us);

// Current UTC wall-clock time in microseconds since the epoch
int64_t now_us();

} // namespace rawinput
