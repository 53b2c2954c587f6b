#include "NetUtil.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>

#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

bool connectWithin(int fd, const sockaddr* addr, socklen_t addrLen, int timeoutMs) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }
    if (::connect(fd, addr, addrLen) == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, timeoutMs);
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        return false;
    }

    // Writable only says the handshake ended; SO_ERROR says how
    int soError = 0;
    socklen_t len = sizeof(soError);
    return getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0;
}

int waitReadable(int fd, int timeoutMs) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready <= 0) {
        return ready;
    }
    return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) ? 1 : 0;
}

int openListener(int port, int backlog, int& boundPort, std::string& error) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = std::string("Failed to create socket: ") + std::strerror(errno);
        return -1;
    }

    auto fail = [fd, &error](const std::string& what) {
        error = what + ": " + std::strerror(errno);
        ::close(fd);
        return -1;
    };

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        return fail("Failed to set SO_REUSEADDR");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("Failed to bind port " + std::to_string(port));
    }
    if (::listen(fd, backlog) < 0) {
        return fail("Failed to listen");
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return fail("Failed to read bound address");
    }
    boundPort = ntohs(addr.sin_port);
    return fd;
}

bool sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}
