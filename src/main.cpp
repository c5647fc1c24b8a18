#include "logging/capture_writer.hpp"
#include "rawinput/rate_codec.hpp"
#include "rawinput/types.hpp"
#include "streaming/connection.hpp"
#include "streaming/stream_sender.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <time.h>

// --- Argument parsing ---

struct Args {
    rawinput::SenderConfig sender;
    rawinput::ChannelIdentity id{"NT", "", "", "R0"};
    double rate = 0.0;
    int64_t start_us = 0;
    bool start_given = false;
    const char* input = nullptr;    // "-" = stdin
    const char* capture = nullptr;
};

static void usage(const char* prog) {
    std::printf("Usage: %s --port PORT --tag TAG --sta STA --cha CHA --rate HZ\n"
                "          [--host ADDR] [--net NN] [--loc LL] [--start TIME]\n"
                "          [--activity N] [--io-clock N] [--quality N] [--timing-quality N]\n"
                "          [--capture FILE] SAMPLES\n\n"
                "Streams one channel of integer samples to an Edge/CWB RawInputServer.\n\n"
                "  SAMPLES: file of whitespace-separated integers, '-' for stdin\n"
                "  --tag:   session tag, at most 10 characters\n"
                "  --start: UTC time of the first sample, YYYY-MM-DDTHH:MM:SS[.ffffff]\n"
                "           (default: now)\n"
                "  --capture FILE: also record every byte sent as an LZ4 frame\n\n"
                "Defaults: host 127.0.0.1, network NT, location R0\n", prog);
}

// YYYY-MM-DDTHH:MM:SS[.ffffff] (a space may replace the T), always UTC
static bool parse_time(const char* str, int64_t& out_us) {
    struct tm tm{};
    const char* p = strptime(str, "%Y-%m-%dT%H:%M:%S", &tm);
    if (!p) p = strptime(str, "%Y-%m-%d %H:%M:%S", &tm);
    if (!p) return false;

    int64_t usec = 0;
    if (*p == '.') {
        ++p;
        int digits = 0;
        while (*p >= '0' && *p <= '9') {
            if (digits < 6) {
                usec = usec * 10 + (*p - '0');
                digits++;
            }
            ++p;
        }
        if (digits == 0) return false;
        for (; digits < 6; ++digits) usec *= 10;
    }
    if (*p == 'Z') ++p;
    if (*p != '\0') return false;

    out_us = static_cast<int64_t>(timegm(&tm)) * 1'000'000 + usec;
    return true;
}

static uint8_t parse_flag(const char* name, const char* str) {
    char* end = nullptr;
    long v = std::strtol(str, &end, 10);
    if (*str == '\0' || *end != '\0' || v < 0 || v > 255) {
        std::fprintf(stderr, "Error: %s must be 0-255, got '%s'\n", name, str);
        std::exit(1);
    }
    return static_cast<uint8_t>(v);
}

static Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            args.sender.host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            args.sender.port = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--tag") == 0 && i + 1 < argc) {
            args.sender.tag = argv[++i];
        } else if (std::strcmp(argv[i], "--net") == 0 && i + 1 < argc) {
            args.id.network = argv[++i];
        } else if (std::strcmp(argv[i], "--sta") == 0 && i + 1 < argc) {
            args.id.station = argv[++i];
        } else if (std::strcmp(argv[i], "--cha") == 0 && i + 1 < argc) {
            args.id.channel = argv[++i];
        } else if (std::strcmp(argv[i], "--loc") == 0 && i + 1 < argc) {
            args.id.location = argv[++i];
        } else if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            args.rate = std::strtod(argv[++i], nullptr);
        } else if (std::strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
            if (!parse_time(argv[++i], args.start_us)) {
                std::fprintf(stderr, "Error: Invalid start time '%s'\n", argv[i]);
                std::fprintf(stderr, "Expected: YYYY-MM-DDTHH:MM:SS[.ffffff]\n");
                std::exit(1);
            }
            args.start_given = true;
        } else if (std::strcmp(argv[i], "--activity") == 0 && i + 1 < argc) {
            args.sender.flags.activity = parse_flag("--activity", argv[++i]);
        } else if (std::strcmp(argv[i], "--io-clock") == 0 && i + 1 < argc) {
            args.sender.flags.io_clock = parse_flag("--io-clock", argv[++i]);
        } else if (std::strcmp(argv[i], "--quality") == 0 && i + 1 < argc) {
            args.sender.flags.quality = parse_flag("--quality", argv[++i]);
        } else if (std::strcmp(argv[i], "--timing-quality") == 0 && i + 1 < argc) {
            args.sender.flags.timing_quality = parse_flag("--timing-quality", argv[++i]);
        } else if (std::strcmp(argv[i], "--capture") == 0 && i + 1 < argc) {
            args.capture = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            std::exit(0);
        } else if (argv[i][0] != '-' || std::strcmp(argv[i], "-") == 0) {
            args.input = argv[i];
        } else {
            std::fprintf(stderr, "Error: Unknown option '%s'\n", argv[i]);
            usage(argv[0]);
            std::exit(1);
        }
    }

    const char* missing = nullptr;
    if (args.sender.port <= 0 || args.sender.port > 65535) missing = "--port";
    else if (args.sender.tag.empty()) missing = "--tag";
    else if (args.id.station.empty()) missing = "--sta";
    else if (args.id.channel.empty()) missing = "--cha";
    else if (args.rate <= 0.0) missing = "--rate";
    else if (!args.input) missing = "SAMPLES";
    if (missing) {
        std::fprintf(stderr, "Error: %s is required\n", missing);
        usage(argv[0]);
        std::exit(1);
    }

    if (!rawinput::rate_encodable(args.rate)) {
        std::fprintf(stderr, "Error: --rate %g Hz cannot be encoded (max %g Hz)\n",
                     args.rate, rawinput::MAX_ENCODABLE_RATE);
        std::exit(1);
    }

    if (!args.start_given) {
        args.start_us = rawinput::now_us();
    }

    return args;
}

// Whitespace-separated integers; anything else is an error.
static bool read_samples(const char* path, std::vector<int32_t>& out) {
    FILE* f = (std::strcmp(path, "-") == 0) ? stdin : std::fopen(path, "r");
    if (!f) {
        std::perror(path);
        return false;
    }

    bool ok = true;
    long long v = 0;
    int rc;
    while ((rc = std::fscanf(f, "%lld", &v)) == 1) {
        if (v < INT32_MIN || v > INT32_MAX) {
            std::fprintf(stderr, "Error: sample %zu out of int32 range: %lld\n",
                         out.size(), v);
            ok = false;
            break;
        }
        out.push_back(static_cast<int32_t>(v));
    }
    if (ok && rc != EOF) {
        std::fprintf(stderr, "Error: %s: non-integer data after sample %zu\n",
                     path, out.size());
        ok = false;
    }
    if (ok && std::ferror(f)) {
        std::fprintf(stderr, "Error: %s: %s\n", path, strerror(errno));
        ok = false;
    }

    if (f != stdin) std::fclose(f);
    return ok;
}

int main(int argc, char* argv[]) {
    Args args = parse_args(argc, argv);

    std::vector<int32_t> samples;
    if (!read_samples(args.input, samples)) {
        return 1;
    }

    rawinput::SeedName seedname;
    if (!rawinput::make_seedname(args.id, seedname)) {
        std::fprintf(stderr, "Error: station/channel codes do not fit NNSSSSSCCCLL\n");
        return 1;
    }

    rawinput::RateCode code = rawinput::encode_rate(args.rate);
    rawinput::TimeFields t = rawinput::split_time(args.start_us);

    std::printf("\n============================================================\n"
                "  rawinput-send\n"
                "============================================================\n");
    std::printf("  Collector: %s:%d  tag '%s'\n",
                args.sender.host.c_str(), args.sender.port, args.sender.tag.c_str());
    std::printf("  Channel:   '%s'  %zu samples @ %g Hz (mantissa %d, divisor %d)\n",
                rawinput::seedname_str(seedname).c_str(), samples.size(), args.rate,
                code.mantissa, code.divisor);
    std::printf("  Start:     %04d-%03d %05d.%06d\n",
                t.year, t.doy, t.secs, t.usecs);

    std::unique_ptr<rawinput::CaptureWriter> capture;
    if (args.capture) {
        capture = std::make_unique<rawinput::CaptureWriter>(args.capture);
        if (!capture->is_open()) {
            std::fprintf(stderr, "Failed to open capture file %s\n", args.capture);
            return 1;
        }
        std::printf("  Capture:   %s (LZ4)\n", args.capture);
    }

    rawinput::StreamSender sender(args.sender);
    rawinput::SendResult result;
    {
        rawinput::Connection conn;
        conn.set_capture(capture.get());
        result = sender.send_channel(args.id, args.rate, args.start_us,
                                     samples.data(), samples.size(), conn);
        conn.close();
    }

    int rc = 0;
    if (capture) {
        rawinput::Status st = capture->close();
        if (st != rawinput::Status::OK) {
            std::fprintf(stderr, "Capture %s incomplete: %s\n",
                         args.capture, rawinput::status_str(st));
            rc = 1;
        } else {
            std::printf("  Capture:   %lu bytes -> %lu bytes\n",
                        static_cast<unsigned long>(capture->bytes_in()),
                        static_cast<unsigned long>(capture->bytes_out()));
        }
    }

    if (!result.ok()) {
        std::fprintf(stderr, "\n[FAIL] %s: %s\n",
                     rawinput::status_str(result.status), result.error.c_str());
        if (!result.confirmed.empty()) {
            const rawinput::Chunk& last = result.confirmed.back();
            std::fprintf(stderr, "  Confirmed %zu chunks (%zu samples); resume at sample %zu\n",
                         result.confirmed.size(), result.samples_confirmed(),
                         last.offset + last.count);
        } else {
            std::fprintf(stderr, "  No data confirmed\n");
        }
        return 2;
    }

    std::printf("\n[OK] %zu packets + forceout, %lu bytes, next sequence %d\n",
                result.confirmed.size(),
                static_cast<unsigned long>(result.bytes_sent), result.next_sequence);
    return rc;
}
