#include "kg_protected_service.hpp"
#include "kg_logger.hpp"
#include "kg_socket.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace kg {

ProtectedService::ProtectedService(uint16_t port, std::string bind_address, int backlog)
    : port_(port)
    , bind_address_(std::move(bind_address))
    , backlog_(backlog) {}

ProtectedService::~ProtectedService() {
    stop();
}

bool ProtectedService::start() {
    if (running_) return true;

    listen_fd_ = net::open_tcp_listener(bind_address_, port_, backlog_, last_error_);
    if (listen_fd_ < 0) {
        KG_LOG_ERROR("protected", "Cannot listen on port " + std::to_string(port_) + ": " +
                                  last_error_);
        return false;
    }
    port_ = net::local_port(listen_fd_);

    running_ = true;
    thread_ = std::thread(&ProtectedService::serve_loop, this);
    KG_LOG_INFO("protected", "Listening on " + bind_address_ + ":" + std::to_string(port_));
    return true;
}

void ProtectedService::stop() {
    if (!running_.exchange(false)) return;
    net::wake_listener(listen_fd_);
    if (thread_.joinable()) {
        thread_.join();
    }
    close(listen_fd_);
    listen_fd_ = -1;
}

void ProtectedService::serve_loop() {
    const size_t greeting_len = std::strlen(kGreeting);

    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = static_cast<socklen_t>(sizeof(client_addr));

        int client = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                             &addr_len, SOCK_CLOEXEC);
        if (client < 0) {
            int err = errno;
            if (!running_) break;
            if (net::is_transient_accept_error(err)) continue;
            KG_LOG_WARN("protected", std::string("accept failed: ") + std::strerror(err));
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        // Bounded send so a peer with a full window cannot hold the loop.
        timeval tv{};
        tv.tv_sec = 2;
        setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        size_t sent = 0;
        while (sent < greeting_len) {
            ssize_t n = send(client, kGreeting + sent, greeting_len - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                KG_LOG_DEBUG("protected", std::string("send failed: ") + std::strerror(errno));
                break;
            }
            sent += static_cast<size_t>(n);
        }
        close(client);
        served_.fetch_add(1);

        KG_LOG_INFO("protected", "Connection from " + net::peer_address(client_addr));
    }
}

} // namespace kg
