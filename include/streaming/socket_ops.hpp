#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rawinput {

constexpr double SEND_TIMEOUT_SEC = 30.0;

// Socket primitives used by Connection. Tests substitute a fake to count
// connect attempts and backoff sleeps without touching the network.
class SocketOps {
public:
    virtual ~SocketOps() = default;

    // Returns a connected fd, or -1 with err filled in.
    virtual int connect(const std::string& host, int port, std::string& err) = 0;

    // Write all of data. False with err filled in on any error or timeout.
    virtual bool send_all(int fd, const uint8_t* data, size_t len,
                          std::string& err) = 0;

    virtual void close(int fd) = 0;

    virtual void sleep_sec(double sec) = 0;
};

// Blocking TCP over POSIX sockets
class PosixSocketOps : public SocketOps {
public:
    explicit PosixSocketOps(double send_timeout_sec = SEND_TIMEOUT_SEC)
        : send_timeout_sec_(send_timeout_sec) {}

    int connect(const std::string& host, int port, std::string& err) override;
    bool send_all(int fd, const uint8_t* data, size_t len,
                  std::string& err) override;
    void close(int fd) override;
    void sleep_sec(double sec) override;

private:
    double send_timeout_sec_;
};

// Process-wide POSIX instance used when no SocketOps is supplied
SocketOps& default_socket_ops();

} // namespace rawinput
