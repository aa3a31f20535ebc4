/*******************************************************************************
    Project: Distributed Benchmark Task Scheduler
    Authors: benchsched developers
    Date: October 19, 2026

    File: tcp_server.cpp

    Description:
        Listening socket setup, the accept loop and handler bookkeeping for
        TcpServer (see tcp_server.h).

*******************************************************************************/

//==============================================================================
// TABLE OF CONTENTS
//==============================================================================
//
// 1. CONSTRUCTOR & DESTRUCTOR
// 2. LIFECYCLE MANAGEMENT (start, stop, setup_server_socket)
// 3. CONNECTION HANDLING (accept_connections, run_handler)
//
//==============================================================================

#include "common/tcp_server.h"
#include "common/tcp_connection.h"
#include "common/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

namespace benchsched {

//==============================================================================
// SECTION 1: CONSTRUCTOR & DESTRUCTOR
//==============================================================================

TcpServer::TcpServer(const std::string& server_name, const std::string& bind_host,
                     uint16_t listen_port, int read_timeout_ms)
    : server_name_(server_name),
      bind_host_(bind_host),
      listen_port_(listen_port),
      read_timeout_ms_(read_timeout_ms),
      server_socket_(-1),
      running_(false),
      active_handlers_(0),
      connections_accepted_(0) {
}

TcpServer::~TcpServer() {
    stop();
}

//==============================================================================
// SECTION 2: LIFECYCLE MANAGEMENT
//==============================================================================

bool TcpServer::start() {
    if (running_) {
        Logger::warning(server_name_ + " already running");
        return false;
    }

    if (!setup_server_socket()) {
        Logger::error("Failed to setup server socket for " + server_name_);
        return false;
    }

    running_ = true;
    accept_thread_ = std::thread(&TcpServer::accept_connections, this);

    Logger::info(server_name_ + " listening on " +
                 (bind_host_.empty() ? std::string("0.0.0.0") : bind_host_) + ":" +
                 std::to_string(listen_port_));
    return true;
}

void TcpServer::stop() {
    bool was_running = running_.exchange(false);

    // shutdown() wakes the accept thread; the descriptor is only closed
    // after that thread has stopped using it.
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_socket_ >= 0) {
        close(server_socket_);
        server_socket_ = -1;
    }

    // Let in-flight exchanges finish; they hold no reference to the listening
    // socket, only to this object.
    std::unique_lock<std::mutex> lock(handlers_mutex_);
    handlers_cv_.wait(lock, [this]() { return active_handlers_ == 0; });

    if (was_running) {
        Logger::info(server_name_ + " stopped");
    }
}

bool TcpServer::setup_server_socket() {
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        Logger::error("Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        Logger::warning("Failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(listen_port_);

    if (bind_host_.empty() || bind_host_ == "0.0.0.0") {
        address.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_host_.c_str(), &address.sin_addr) != 1) {
        Logger::error("Invalid bind address: " + bind_host_);
        close_socket(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Failed to bind socket: " + std::string(strerror(errno)));
        close_socket(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 64) < 0) {
        Logger::error("Failed to listen: " + std::string(strerror(errno)));
        close_socket(server_socket_);
        server_socket_ = -1;
        return false;
    }

    // Resolve the real port when an ephemeral one was requested.
    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_socket_, (struct sockaddr*)&bound, &bound_len) == 0) {
        listen_port_ = ntohs(bound.sin_port);
    }

    return true;
}

//==============================================================================
// SECTION 3: CONNECTION HANDLING
//==============================================================================
//
// accept_connections()
// --------------------
// Runs on accept_thread_. Each accepted socket is handed to a detached
// handler thread; the handler count (not the thread handle) is what stop()
// waits on. The count is incremented here, before the thread exists, so
// stop() can never observe zero while a handler is about to start.
//
//==============================================================================

void TcpServer::accept_connections() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &addr_len);

        if (client_socket < 0) {
            int err = errno;
            if (!running_) break;
            if (err == EINTR) continue;
            Logger::error(server_name_ + " accept failed: " + std::string(strerror(err)));
            if (err == EBADF || err == EINVAL) break;
            // EMFILE and friends: back off instead of spinning.
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        char client_ip[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &client_addr.sin_addr, client_ip, INET_ADDRSTRLEN);
        connections_accepted_++;
        Logger::debug(server_name_ + " accepted connection from " + std::string(client_ip));

        set_socket_timeouts(client_socket, read_timeout_ms_);

        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            active_handlers_++;
        }

        try {
            std::thread(&TcpServer::run_handler, this, client_socket,
                        std::string(client_ip)).detach();
        } catch (const std::system_error& e) {
            Logger::error(server_name_ + " could not spawn handler: " + std::string(e.what()));
            close_socket(client_socket);
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            active_handlers_--;
            handlers_cv_.notify_all();
        }
    }
}

// Wraps handle_connection() so that no exception escapes a detached thread
// and the socket is always closed and the handler always accounted for.
void TcpServer::run_handler(int client_socket, std::string peer_address) {
    try {
        handle_connection(client_socket, peer_address);
    } catch (const std::exception& e) {
        Logger::error(server_name_ + " handler for " + peer_address +
                      " failed: " + std::string(e.what()));
    }

    close_socket(client_socket);

    std::lock_guard<std::mutex> lock(handlers_mutex_);
    active_handlers_--;
    handlers_cv_.notify_all();
}

} // namespace benchsched
