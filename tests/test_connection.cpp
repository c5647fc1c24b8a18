#include "streaming/connection.hpp"
#include "rawinput/packet.hpp"

#include "fake_socket_ops.hpp"

#include <gtest/gtest.h>

using namespace rawinput;

TEST(Connection, OpenSendsTagFirst) {
    FakeSocketOps ops;
    Connection conn(ops);
    EXPECT_EQ(conn.state(), Connection::State::UNOPENED);

    ASSERT_EQ(conn.open("edge.example", 2061, "QUAKE01"), Status::OK);
    EXPECT_TRUE(conn.is_open());
    EXPECT_EQ(ops.last_host, "edge.example");
    EXPECT_EQ(ops.last_port, 2061);
    EXPECT_EQ(ops.connect_calls, 1);
    EXPECT_TRUE(ops.sleeps.empty());

    ASSERT_EQ(ops.sent.size(), 1u);
    std::vector<uint8_t> tag;
    encode_tag(tag, "QUAKE01");
    EXPECT_EQ(ops.sent[0], tag);

    Connection::Stats s = conn.get_stats();
    EXPECT_EQ(s.packets_sent, 1u);
    EXPECT_EQ(s.bytes_sent, HEADER_SIZE);
}

TEST(Connection, RetriesTwiceThenConnects) {
    FakeSocketOps ops;
    ops.fail_connects = 2;
    Connection conn(ops);

    ASSERT_EQ(conn.open("localhost", 2061, "TAG"), Status::OK);
    EXPECT_EQ(ops.connect_calls, 3);
    ASSERT_EQ(ops.sleeps.size(), 2u);
    EXPECT_DOUBLE_EQ(ops.sleeps[0], 1.0);
    EXPECT_DOUBLE_EQ(ops.sleeps[1], 1.0);
    EXPECT_EQ(conn.get_stats().connect_attempts, 3);
    EXPECT_TRUE(conn.is_open());
}

TEST(Connection, GivesUpAfterThreeAttempts) {
    FakeSocketOps ops;
    ops.fail_connects = -1;
    Connection conn(ops);

    EXPECT_EQ(conn.open("localhost", 2061, "TAG"), Status::CONNECTION_FAILED);
    EXPECT_EQ(ops.connect_calls, 3);
    EXPECT_EQ(ops.sleeps.size(), 2u);
    EXPECT_TRUE(ops.sent.empty());
    EXPECT_EQ(conn.state(), Connection::State::CLOSED);
    EXPECT_EQ(conn.last_error(), "Connection refused");
}

TEST(Connection, LongTagRejectedBeforeConnect) {
    FakeSocketOps ops;
    Connection conn(ops);

    EXPECT_EQ(conn.open("localhost", 2061, "ELEVENCHARS"), Status::INVALID_TAG);
    EXPECT_EQ(ops.connect_calls, 0);
    EXPECT_EQ(conn.state(), Connection::State::UNOPENED);

    // Exactly ten is fine
    EXPECT_EQ(conn.open("localhost", 2061, "TENCHARS10"), Status::OK);
}

TEST(Connection, TagSendFailureClosesSocket) {
    FakeSocketOps ops;
    ops.fail_send_at = 0;
    Connection conn(ops);

    EXPECT_EQ(conn.open("localhost", 2061, "TAG"), Status::SEND_FAILED);
    EXPECT_EQ(conn.state(), Connection::State::CLOSED);
    ASSERT_EQ(ops.closed.size(), 1u);
    EXPECT_EQ(conn.last_error(), "Broken pipe");
}

TEST(Connection, SendFailureIsTerminal) {
    FakeSocketOps ops;
    ops.fail_send_at = 2;
    Connection conn(ops);
    ASSERT_EQ(conn.open("localhost", 2061, "TAG"), Status::OK);

    const uint8_t data[4] = {1, 2, 3, 4};
    EXPECT_EQ(conn.send(data, sizeof(data)), Status::OK);
    EXPECT_EQ(conn.send(data, sizeof(data)), Status::SEND_FAILED);
    EXPECT_EQ(conn.last_error(), "Broken pipe");
    EXPECT_EQ(conn.state(), Connection::State::CLOSED);
    EXPECT_EQ(ops.closed.size(), 1u);

    // No reconnect behind the caller's back
    EXPECT_EQ(conn.send(data, sizeof(data)), Status::NOT_OPEN);
    EXPECT_EQ(ops.connect_calls, 1);
    EXPECT_EQ(ops.send_calls, 3);
}

TEST(Connection, SendBeforeOpen) {
    FakeSocketOps ops;
    Connection conn(ops);
    const uint8_t data[1] = {0};
    EXPECT_EQ(conn.send(data, 1), Status::NOT_OPEN);
    EXPECT_EQ(ops.send_calls, 0);
}

TEST(Connection, CloseIsIdempotent) {
    FakeSocketOps ops;
    Connection conn(ops);
    ASSERT_EQ(conn.open("localhost", 2061, "TAG"), Status::OK);

    conn.close();
    conn.close();
    EXPECT_EQ(conn.state(), Connection::State::CLOSED);
    EXPECT_EQ(ops.closed.size(), 1u);
}

TEST(Connection, NeverReopened) {
    FakeSocketOps ops;
    Connection conn(ops);
    ASSERT_EQ(conn.open("localhost", 2061, "TAG"), Status::OK);
    EXPECT_EQ(conn.open("localhost", 2061, "TAG"), Status::BAD_STATE);

    conn.close();
    EXPECT_EQ(conn.open("localhost", 2061, "TAG"), Status::BAD_STATE);
    EXPECT_EQ(ops.connect_calls, 1);
}

TEST(Connection, DestructorReleasesSocket) {
    FakeSocketOps ops;
    {
        Connection conn(ops);
        ASSERT_EQ(conn.open("localhost", 2061, "TAG"), Status::OK);
    }
    ASSERT_EQ(ops.closed.size(), 1u);
    EXPECT_EQ(ops.closed[0], ops.sent_fds[0]);
}

TEST(Connection, IdsAreDistinct) {
    FakeSocketOps ops;
    uint64_t prev = 0;
    for (int i = 0; i < 3; ++i) {
        Connection conn(ops);
        EXPECT_NE(conn.id(), 0u);
        EXPECT_NE(conn.id(), prev);
        prev = conn.id();
    }
}
