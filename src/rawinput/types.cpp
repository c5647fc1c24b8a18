#include "rawinput/types.hpp"

#include <time.h>

namespace rawinput {

const char* status_str(Status s) {
    switch (s) {
        case Status::OK:                return "ok";
        case Status::INVALID_TAG:       return "tag longer than 10 characters";
        case Status::INVALID_SEEDNAME:  return "invalid seed name";
        case Status::INVALID_RATE:      return "sample rate not encodable";
        case Status::PAYLOAD_TOO_LARGE: return "data packet limited to 1-32767 samples";
        case Status::CONNECTION_FAILED: return "could not open socket";
        case Status::SEND_FAILED:       return "socket send failed";
        case Status::NOT_OPEN:          return "connection not open";
        case Status::BAD_STATE:         return "connection already used";
        case Status::TRUNCATED:         return "truncated packet";
        case Status::BAD_MAGIC:         return "bad packet magic";
        case Status::IO_ERROR:          return "file I/O error";
        case Status::COMPRESSION_ERROR: return "LZ4 error";
    }
    return "unknown";
}

static bool pad_field(const std::string& src, size_t width, char* dst) {
    if (src.size() > width) return false;
    for (size_t i = 0; i < width; ++i) {
        if (i < src.size()) {
            unsigned char c = static_cast<unsigned char>(src[i]);
            if (c < 0x20 || c > 0x7E) return false;
            dst[i] = static_cast<char>(c);
        } else {
            dst[i] = ' ';
        }
    }
    return true;
}

bool make_seedname(const ChannelIdentity& id, SeedName& out) {
    char* p = out.data();
    if (!pad_field(id.network, NETWORK_LEN, p)) return false;
    p += NETWORK_LEN;
    if (!pad_field(id.station, STATION_LEN, p)) return false;
    p += STATION_LEN;
    if (!pad_field(id.channel, CHANNEL_LEN, p)) return false;
    p += CHANNEL_LEN;
    if (!pad_field(id.location, LOCATION_LEN, p)) return false;
    return true;
}

TimeFields split_time(int64_t epoch_us) {
    // Floor division so pre-epoch times keep usecs in [0, 1e6)
    int64_t sec = epoch_us / 1'000'000;
    int64_t usec = epoch_us % 1'000'000;
    if (usec < 0) {
        usec += 1'000'000;
        sec -= 1;
    }

    time_t t = static_cast<time_t>(sec);
    struct tm tm{};
    gmtime_r(&t, &tm);

    TimeFields f;
    f.year  = static_cast<int16_t>(tm.tm_year + 1900);
    f.doy   = static_cast<int16_t>(tm.tm_yday + 1);
    f.secs  = tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
    f.usecs = static_cast<int32_t>(usec);
    return f;
}

int64_t now_us() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1'000'000 + ts.tv_nsec / 1000;
}

} // namespace rawinput
