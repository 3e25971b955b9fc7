#include <midea/tcp_link.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <midea/log.hpp>

namespace midea {

namespace {

bool wait_for(int fd, short events, uint32_t timeout_ms) {
    pollfd pfd{fd, events, 0};
    int res;
    do {
        res = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (res < 0 && errno == EINTR);
    return res > 0 && (pfd.revents & (events | POLLERR | POLLHUP));
}

} // namespace

TcpLink::TcpLink(const std::string& ip, uint16_t p) : address(ip), port(p) {}

TcpLink::~TcpLink() {
    close();
}

bool TcpLink::open(uint32_t timeout_ms) {
    close();

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        MIDEA_LOGE(MIDEA_LOG_TAG, "invalid appliance address %s", address.c_str());
        return false;
    }

    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        MIDEA_LOGE(MIDEA_LOG_TAG, "socket: %s", strerror(errno));
        return false;
    }
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        MIDEA_LOGE(MIDEA_LOG_TAG, "fcntl: %s", strerror(errno));
        close();
        return false;
    }
    int one = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
        MIDEA_LOGD(MIDEA_LOG_TAG, "TCP_NODELAY: %s", strerror(errno));

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 && errno != EINPROGRESS) {
        MIDEA_LOGW(MIDEA_LOG_TAG, "connect %s:%u: %s", address.c_str(), port, strerror(errno));
        close();
        return false;
    }

    if (!wait_for(fd, POLLOUT, timeout_ms)) {
        MIDEA_LOGW(MIDEA_LOG_TAG, "connect %s:%u timed out", address.c_str(), port);
        close();
        return false;
    }

    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0 || so_error != 0) {
        MIDEA_LOGW(MIDEA_LOG_TAG, "connect %s:%u: %s", address.c_str(), port, strerror(so_error));
        close();
        return false;
    }
    return true;
}

bool TcpLink::write(const uint8_t* buf, size_t len, uint32_t timeout_ms) {
    if (fd < 0)
        return false;

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (!wait_for(fd, POLLOUT, timeout_ms))
                return false;
            continue;
        }
        return false;
    }
    return true;
}

transport::LinkError TcpLink::read(uint8_t* buf, size_t len, size_t* out_len, uint32_t timeout_ms) {
    *out_len = 0;
    if (fd < 0)
        return transport::LinkError::Transport;

    if (!wait_for(fd, POLLIN, timeout_ms))
        return transport::LinkError::Timeout;

    ssize_t n;
    do {
        n = ::recv(fd, buf, len, 0);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        *out_len = static_cast<size_t>(n);
        return transport::LinkError::Ok;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        return transport::LinkError::Timeout;
    // orderly shutdown by the appliance counts as a transport failure
    return transport::LinkError::Transport;
}

void TcpLink::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace midea
