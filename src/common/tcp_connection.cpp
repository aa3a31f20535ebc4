/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: tcp_connection.cpp

    Description:
        Client-side connect with timeout, whole-buffer send, read-until-EOF,
        and the request/response helper built from them.

    Dependencies:
        - POSIX: socket, connect, poll, send, recv, shutdown, close
        - getaddrinfo() for name resolution (reentrant, unlike
          gethostbyname(), which matters because node workers run in threads
          inside the integration tests)

*******************************************************************************/

#include "common/tcp_connection.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netdb.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace benchsched {

//==============================================================================
// SECTION 1: SOCKET OPTIONS
//==============================================================================

bool set_socket_timeouts(int socket_fd, int timeout_ms) {
    if (timeout_ms <= 0) return true;

    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    if (setsockopt(socket_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        Logger::warning("Failed to set SO_RCVTIMEO: " + std::string(strerror(errno)));
        return false;
    }
    if (setsockopt(socket_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        Logger::warning("Failed to set SO_SNDTIMEO: " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

void close_socket(int socket_fd) {
    if (socket_fd >= 0) {
        shutdown(socket_fd, SHUT_RDWR);
        close(socket_fd);
    }
}

std::string local_hostname() {
    char buf[256];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "localhost";
    }
    buf[sizeof(buf) - 1] = '\0';
    return std::string(buf);
}

//==============================================================================
// SECTION 2: CONNECT WITH TIMEOUT
//==============================================================================
//
// connect_to_host()
// -----------------
// Non-blocking connect + poll() so an unreachable host costs timeout_ms
// instead of the kernel's default (minutes). Once connected the socket goes
// back to blocking mode with SO_RCVTIMEO / SO_SNDTIMEO applied.
//
//==============================================================================

static bool connect_with_timeout(int fd, const struct sockaddr* addr, socklen_t len,
                                 int timeout_ms) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return false;
    }

    int rc = connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) {
        return false;
    }

    if (rc < 0) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int ready = poll(&pfd, 1, timeout_ms > 0 ? timeout_ms : -1);
        if (ready <= 0) {
            if (ready == 0) errno = ETIMEDOUT;
            return false;
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            return false;
        }
        if (so_error != 0) {
            errno = so_error;
            return false;
        }
    }

    return fcntl(fd, F_SETFL, flags) >= 0;
}

int connect_to_host(const std::string& host, uint16_t port, int timeout_ms, bool quiet) {
    const LogLevel failure_level = quiet ? LogLevel::DEBUG : LogLevel::ERROR;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (gai != 0 || !result) {
        Logger::log(failure_level, "Failed to resolve hostname " + host + ": " +
                                   std::string(gai_strerror(gai)));
        return -1;
    }

    int socket_fd = -1;
    int last_errno = 0;
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        socket_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (socket_fd < 0) {
            last_errno = errno;
            continue;
        }
        if (connect_with_timeout(socket_fd, ai->ai_addr, ai->ai_addrlen, timeout_ms)) {
            break;
        }
        last_errno = errno;
        close(socket_fd);
        socket_fd = -1;
    }
    freeaddrinfo(result);

    if (socket_fd < 0) {
        Logger::log(failure_level, "Failed to connect to " + host + ":" + port_str + ": " +
                                   std::string(strerror(last_errno)));
        return -1;
    }

    set_socket_timeouts(socket_fd, timeout_ms);
    return socket_fd;
}

//==============================================================================
// SECTION 3: SEND / RECEIVE
//==============================================================================

bool send_all(int socket_fd, const std::string& data) {
    size_t sent_total = 0;
    while (sent_total < data.size()) {
        ssize_t sent = send(socket_fd, data.data() + sent_total,
                            data.size() - sent_total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            Logger::debug("send() failed: " + std::string(strerror(errno)));
            return false;
        }
        sent_total += static_cast<size_t>(sent);
    }
    return true;
}

bool receive_all(int socket_fd, size_t max_bytes, std::string& out, bool allow_empty) {
    out.clear();
    char buf[4096];

    while (out.size() < max_bytes) {
        size_t want = std::min(sizeof(buf), max_bytes - out.size());
        ssize_t received = recv(socket_fd, buf, want, 0);

        if (received > 0) {
            out.append(buf, static_cast<size_t>(received));
            continue;
        }
        if (received == 0) {
            break;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            // Timed out: whatever arrived so far is the message.
            if (out.empty()) {
                Logger::debug("recv() timed out with no data");
                return false;
            }
            break;
        }
        Logger::debug("recv() failed: " + std::string(strerror(errno)));
        return !out.empty();
    }

    return allow_empty || !out.empty();
}

//==============================================================================
// SECTION 4: REQUEST / RESPONSE
//==============================================================================

bool send_request(const std::string& host, uint16_t port, const std::string& request,
                  int timeout_ms, std::string* response, size_t max_response, bool quiet) {
    int socket_fd = connect_to_host(host, port, timeout_ms, quiet);
    if (socket_fd < 0) {
        return false;
    }

    if (!send_all(socket_fd, request)) {
        Logger::log(quiet ? LogLevel::DEBUG : LogLevel::ERROR,
                    "Failed to send request to " + host + ":" + std::to_string(port));
        close_socket(socket_fd);
        return false;
    }

    // Half-close: the peer sees EOF and knows the request is complete.
    shutdown(socket_fd, SHUT_WR);

    bool ok = true;
    if (response) {
        ok = receive_all(socket_fd, max_response, *response, true);
        if (!ok) {
            Logger::log(quiet ? LogLevel::DEBUG : LogLevel::ERROR,
                        "No response from " + host + ":" + std::to_string(port));
        }
    }

    close(socket_fd);
    return ok;
}

} // namespace benchsched
