/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: tcp_connection.h

    Description:
        POSIX socket helpers for the one-exchange-per-connection protocols
        used by the scheduler and the event logger.

        Connection Pattern (client side):
            1. connect (with timeout)
            2. send the whole request
            3. shutdown(SHUT_WR)    <- tells the server the request is complete
            4. read the reply until the server closes
            5. close

        Servers read until EOF, the size limit, or the read timeout, whichever
        comes first, so a peer that never half-closes costs at most one read
        timeout and a hung peer can never wedge a handler thread.

    Error Reporting:
        Nothing here throws. Functions return false / -1 and log the errno
        text, matching the rest of the network code.

*******************************************************************************/

#ifndef TCP_CONNECTION_H
#define TCP_CONNECTION_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace benchsched {

// Opens a TCP connection to host:port. The connect itself is bounded by
// timeout_ms; the returned socket also has send/receive timeouts of timeout_ms.
// Returns the socket fd, or -1 on failure (logged at the given severity:
// quiet=true logs failures at DEBUG, for best-effort senders).
int connect_to_host(const std::string& host, uint16_t port, int timeout_ms, bool quiet = false);

// SO_RCVTIMEO / SO_SNDTIMEO on an existing socket. timeout_ms <= 0 leaves the
// socket fully blocking.
bool set_socket_timeouts(int socket_fd, int timeout_ms);

// Writes all of data (MSG_NOSIGNAL; a closed peer is an error, not SIGPIPE).
bool send_all(int socket_fd, const std::string& data);

// Reads until EOF, max_bytes, or a receive timeout. A timeout after some bytes
// have arrived counts as the end of the message. Returns false when nothing
// could be read (error, timeout on an empty stream, or immediate EOF with
// allow_empty == false).
bool receive_all(int socket_fd, size_t max_bytes, std::string& out, bool allow_empty = false);

// shutdown(SHUT_RDWR) + close(); ignores fd < 0.
void close_socket(int socket_fd);

// Full client exchange: connect, send request, half-close, and, when response
// is non-null, read the reply until the server closes. Returns false on any
// network failure.
bool send_request(const std::string& host, uint16_t port, const std::string& request,
                  int timeout_ms, std::string* response, size_t max_response,
                  bool quiet = false);

// gethostname(), or "localhost" if it fails.
std::string local_hostname();

} // namespace benchsched

#endif // TCP_CONNECTION_H
