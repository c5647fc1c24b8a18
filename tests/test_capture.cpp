#include "logging/capture_reader.hpp"
#include "logging/capture_writer.hpp"
#include "rawinput/packet.hpp"
#include "streaming/connection.hpp"
#include "streaming/stream_sender.hpp"

#include "fake_socket_ops.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace rawinput;

namespace {

std::string temp_path(const char* name) {
    return ::testing::TempDir() + "rawinput_" + name + ".lz4";
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::vector<uint8_t> out;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) return out;
    uint8_t buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.insert(out.end(), buf, buf + n);
    std::fclose(f);
    return out;
}

} // namespace

TEST(Capture, RoundTripsLargeWrites) {
    std::string path = temp_path("large");

    // Larger than one compression slice, with a non-trivial pattern
    std::vector<uint8_t> data(200 * 1024 + 17);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>((i * 7) ^ (i >> 9));

    {
        CaptureWriter w(path.c_str());
        ASSERT_TRUE(w.is_open());
        ASSERT_EQ(w.write(data.data(), 1000), Status::OK);
        ASSERT_EQ(w.write(data.data() + 1000, data.size() - 1000), Status::OK);
        EXPECT_EQ(w.close(), Status::OK);
        EXPECT_EQ(w.close(), Status::OK);
        EXPECT_EQ(w.bytes_in(), data.size());
    }

    CaptureReader r(path.c_str());
    ASSERT_TRUE(r.is_open());
    std::vector<uint8_t> back;
    ASSERT_EQ(r.read_all(back), Status::OK);
    EXPECT_EQ(back, data);
    std::remove(path.c_str());
}

TEST(Capture, RecordsEveryPacketSent) {
    std::string path = temp_path("session");
    FakeSocketOps ops;

    {
        CaptureWriter w(path.c_str());
        ASSERT_TRUE(w.is_open());

        SenderConfig cfg;
        cfg.port = 2061;
        cfg.tag = "CAPTEST";
        StreamSender sender(cfg, ops);
        Connection conn(ops);
        conn.set_capture(&w);

        std::vector<int32_t> samples(150, 42);
        ChannelIdentity id{"NT", "BOU", "HEZ", "R0"};
        ASSERT_TRUE(sender.send_channel(id, 1.0, 0, samples.data(),
                                        samples.size(), conn).ok());
        ASSERT_EQ(w.close(), Status::OK);
    }

    std::vector<uint8_t> expected;
    for (const auto& pkt : ops.sent) expected.insert(expected.end(), pkt.begin(), pkt.end());

    CaptureReader r(path.c_str());
    std::vector<uint8_t> back;
    ASSERT_EQ(r.read_all(back), Status::OK);
    EXPECT_EQ(back, expected);

    // Walk the stream the way rawinput-dump does
    size_t off = 0;
    int packets = 0;
    while (off < back.size()) {
        PacketHeader h;
        ASSERT_EQ(decode_header(back.data() + off, back.size() - off, h), Status::OK);
        off += packet_size(h);
        packets++;
    }
    EXPECT_EQ(off, back.size());
    EXPECT_EQ(packets, 5);
    std::remove(path.c_str());
}

TEST(Capture, UnfinishedFrameIsTruncated) {
    std::string path = temp_path("full");
    std::string cut = temp_path("cut");

    std::vector<uint8_t> data(50000, 0x5A);
    {
        CaptureWriter w(path.c_str());
        ASSERT_EQ(w.write(data.data(), data.size()), Status::OK);
        ASSERT_EQ(w.close(), Status::OK);
    }

    std::vector<uint8_t> bytes = read_file(path);
    ASSERT_GT(bytes.size(), 8u);
    FILE* f = std::fopen(cut.c_str(), "wb");
    ASSERT_NE(f, nullptr);
    ASSERT_EQ(std::fwrite(bytes.data(), 1, bytes.size() - 4, f), bytes.size() - 4);
    std::fclose(f);

    CaptureReader r(cut.c_str());
    std::vector<uint8_t> back;
    EXPECT_EQ(r.read_all(back), Status::TRUNCATED);

    std::remove(path.c_str());
    std::remove(cut.c_str());
}

TEST(Capture, MissingFile) {
    CaptureReader r("/nonexistent/dir/capture.lz4");
    EXPECT_FALSE(r.is_open());
    std::vector<uint8_t> back;
    EXPECT_EQ(r.read_all(back), Status::IO_ERROR);

    CaptureWriter w("/nonexistent/dir/capture.lz4");
    EXPECT_FALSE(w.is_open());
    const uint8_t b = 1;
    EXPECT_EQ(w.write(&b, 1), Status::IO_ERROR);
}
