/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: tcp_server.h

    Description:
        Thread-per-connection TCP server shared by the scheduler and the event
        logger. Owns the listening socket, the accept thread and the count of
        running connection handlers; subclasses implement handle_connection().

    Concurrency Model:
        1. Accept Thread: blocks in accept(), spawns one detached handler
           thread per connection.
        2. Handler Threads: run handle_connection() for exactly one
           request/response exchange, then close the socket.

        Every accepted socket gets SO_RCVTIMEO / SO_SNDTIMEO of
        read_timeout_ms, so a sender that stalls mid-message is cut off
        instead of pinning a thread.

    Shutdown Sequence (stop()):
        1. running_ = false
        2. shutdown() the listening socket (accept() returns)
        3. join the accept thread, then close the socket
        4. wait until every in-flight handler has returned

        Subclass destructors must call stop() themselves: handlers call the
        subclass's handle_connection(), so they have to be finished before
        the subclass's members are destroyed.

    Lifecycle:
        MyServer server(...);
        if (!server.start()) { ... }      // bind + listen + accept thread
        ...
        server.stop();                    // idempotent

*******************************************************************************/

#ifndef TCP_SERVER_H
#define TCP_SERVER_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace benchsched {

class TcpServer {
protected:
    std::string server_name_;
    std::string bind_host_;
    uint16_t listen_port_;
    int read_timeout_ms_;

    int server_socket_;
    std::atomic<bool> running_;
    std::thread accept_thread_;

    // Number of handler threads currently inside handle_connection().
    std::mutex handlers_mutex_;
    std::condition_variable handlers_cv_;
    size_t active_handlers_;

    std::atomic<uint64_t> connections_accepted_;

public:
    // bind_host: "" or "0.0.0.0" for all interfaces. listen_port 0 picks an
    // ephemeral port (see port()).
    TcpServer(const std::string& server_name, const std::string& bind_host,
              uint16_t listen_port, int read_timeout_ms);
    virtual ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    virtual bool start();
    virtual void stop();

    bool is_running() const { return running_; }

    // The port actually bound (differs from the configured one when 0).
    uint16_t port() const { return listen_port_; }

    uint64_t connections_accepted() const { return connections_accepted_; }

protected:
    // One exchange on client_socket. The server closes the socket after this
    // returns; implementations must not close it themselves.
    virtual void handle_connection(int client_socket, const std::string& peer_address) = 0;

private:
    bool setup_server_socket();
    void accept_connections();
    void run_handler(int client_socket, std::string peer_address);
};

} // namespace benchsched

#endif // TCP_SERVER_H
