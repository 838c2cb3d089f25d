#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define ASABACKUP_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection, trying every
// address getaddrinfo returns. The socket is returned still non-blocking.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probing on an established socket.
void enable_keepalive(socket_t sock);

} // namespace platform
