#include "logging/capture_reader.hpp"
#include "rawinput/packet.hpp"
#include "rawinput/rate_codec.hpp"
#include "rawinput/types.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// Prints every packet in a capture written by rawinput-send --capture.

static void print_header(size_t offset, const rawinput::PacketHeader& h) {
    std::string name = rawinput::seedname_str(h.seedname);

    if (h.nsamp == rawinput::NSAMP_TAG) {
        std::printf("%08zx TAG      '%s' seq=%d\n", offset, name.c_str(), h.sequence);
        return;
    }

    const char* kind = (h.nsamp == rawinput::NSAMP_FORCEOUT) ? "FORCEOUT" : "DATA";
    rawinput::RateCode code{h.rate_mantissa, h.rate_divisor};
    std::printf("%08zx %-8s '%s' %04d-%03d %05d.%06d rate=%g (%d/%d) "
                "flags=%u/%u/%u/%u seq=%d nsamp=%d\n",
                offset, kind, name.c_str(), h.year, h.doy, h.secs, h.usecs,
                rawinput::decode_rate(code), h.rate_mantissa, h.rate_divisor,
                h.flags.activity, h.flags.io_clock, h.flags.quality,
                h.flags.timing_quality, h.sequence, h.nsamp);
}

int main(int argc, char* argv[]) {
    const char* path = nullptr;
    bool show_samples = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--samples") == 0) {
            show_samples = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            std::printf("Usage: %s [--samples] CAPTURE\n", argv[0]);
            return 0;
        } else {
            path = argv[i];
        }
    }
    if (!path) {
        std::fprintf(stderr, "Usage: %s [--samples] CAPTURE\n", argv[0]);
        return 1;
    }

    rawinput::CaptureReader reader(path);
    if (!reader.is_open()) return 1;

    std::vector<uint8_t> stream;
    rawinput::Status st = reader.read_all(stream);
    if (st != rawinput::Status::OK) {
        std::fprintf(stderr, "%s: %s\n", path, rawinput::status_str(st));
        return 1;
    }

    size_t off = 0;
    size_t packets = 0;
    size_t total_samples = 0;
    std::vector<int32_t> samples;

    while (off < stream.size()) {
        rawinput::PacketHeader h;
        st = rawinput::decode_header(stream.data() + off, stream.size() - off, h);
        if (st != rawinput::Status::OK) {
            std::fprintf(stderr, "offset %zu: %s\n", off, rawinput::status_str(st));
            return 1;
        }

        size_t size = rawinput::packet_size(h);
        if (off + size > stream.size()) {
            std::fprintf(stderr, "offset %zu: packet needs %zu bytes, %zu left\n",
                         off, size, stream.size() - off);
            return 1;
        }

        print_header(off, h);

        if (h.nsamp > 0) {
            samples.resize(static_cast<size_t>(h.nsamp));
            rawinput::decode_samples(stream.data() + off + rawinput::HEADER_SIZE,
                                     samples.size(), samples.data());
            total_samples += samples.size();
            if (show_samples) {
                for (size_t i = 0; i < samples.size(); ++i) {
                    std::printf("%s%d", (i % 10 == 0) ? "\n    " : " ", samples[i]);
                }
                std::printf("\n");
            }
        }

        off += size;
        packets++;
    }

    std::printf("%zu packets, %zu samples, %zu bytes\n", packets, total_samples, stream.size());
    return 0;
}
