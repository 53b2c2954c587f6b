// NetUtil.hpp
// Small POSIX socket helpers shared by discovery and the inbound server.
#pragma once

#include <string>

#include <sys/socket.h>

// Switches fd to non-blocking and connects, waiting at most timeoutMs.
// The caller keeps ownership of fd and closes it either way.
bool connectWithin(int fd, const sockaddr* addr, socklen_t addrLen, int timeoutMs);

// 1 when fd is readable within timeoutMs, 0 on timeout, -1 on error (errno kept).
int waitReadable(int fd, int timeoutMs);

// TCP listener on all interfaces. port 0 lets the kernel pick one; the port
// actually bound is written to boundPort. Returns -1 with 'error' set on failure.
int openListener(int port, int backlog, int& boundPort, std::string& error);

// Writes all of data; false when the peer went away.
bool sendAll(int fd, const std::string& data);
