#include "streaming/socket_ops.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>
#include <netdb.h>
#include <poll.h>
#include <time.h>
#include <unistd.h>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

namespace rawinput {

static double clock_monotonic() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

int PosixSocketOps::connect(const std::string& host, int port, std::string& err) {
    char port_str[16];
    std::snprintf(port_str, sizeof(port_str), "%d", port);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port_str, &hints, &res);
    if (rc != 0) {
        err = std::string("getaddrinfo(") + host + "): " + gai_strerror(rc);
        return -1;
    }

    int fd = -1;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            err = std::string("socket(): ") + strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;

        err = "connect(" + host + ":" + port_str + "): " + strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) return -1;

    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    // TCP keepalive: notice a dead collector within ~25s on a quiet link
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
    int idle = 10;
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    int intvl = 5;
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    int cnt = 3;
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));

    return fd;
}

// Send loop with an overall deadline, using poll(POLLOUT).
// Always uses MSG_NOSIGNAL so a reset peer surfaces as EPIPE, not SIGPIPE.
bool PosixSocketOps::send_all(int fd, const uint8_t* data, size_t len,
                              std::string& err) {
    double deadline = clock_monotonic() + send_timeout_sec_;
    size_t sent = 0;

    while (sent < len) {
        double remaining = deadline - clock_monotonic();
        if (remaining <= 0) {
            err = "send timed out";
            return false;
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int timeout_ms = static_cast<int>(remaining * 1000);
        if (timeout_ms < 1) timeout_ms = 1;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            err = std::string("poll(): ") + strerror(errno);
            return false;
        }
        if (ret == 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            err = "socket closed by peer";
            return false;
        }

        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            err = std::string("send(): ") + strerror(errno);
            return false;
        }
        sent += static_cast<size_t>(n);
    }

    return true;
}

void PosixSocketOps::close(int fd) {
    if (fd >= 0) ::close(fd);
}

void PosixSocketOps::sleep_sec(double sec) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(sec);
    ts.tv_nsec = static_cast<long>((sec - ts.tv_sec) * 1e9);
    while (nanosleep(&ts, &ts) < 0 && errno == EINTR) {}
}

SocketOps& default_socket_ops() {
    static PosixSocketOps ops;
    return ops;
}

} // namespace rawinput
