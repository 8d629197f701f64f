#include "kg_knock_listener.hpp"
#include "kg_logger.hpp"
#include "kg_socket.hpp"

#include <cerrno>
#include <cstring>
#include <exception>

#include <sys/socket.h>
#include <unistd.h>

namespace kg {

KnockListener::KnockListener(uint16_t port, KnockCallback on_knock,
                             std::string bind_address, int backlog)
    : port_(port)
    , on_knock_(std::move(on_knock))
    , bind_address_(std::move(bind_address))
    , backlog_(backlog) {}

KnockListener::~KnockListener() {
    stop();
}

bool KnockListener::start() {
    if (running_) return true;

    listen_fd_ = net::open_tcp_listener(bind_address_, port_, backlog_, last_error_);
    if (listen_fd_ < 0) {
        KG_LOG_ERROR("listener", "Cannot listen for knocks on port " +
                                 std::to_string(port_) + ": " + last_error_);
        return false;
    }
    port_ = net::local_port(listen_fd_);

    running_ = true;
    thread_ = std::thread(&KnockListener::accept_loop, this);
    KG_LOG_INFO("listener", "Listening for TCP knocks on port " + std::to_string(port_));
    return true;
}

void KnockListener::stop() {
    if (!running_.exchange(false)) return;
    net::wake_listener(listen_fd_);
    if (thread_.joinable()) {
        thread_.join();
    }
    close(listen_fd_);
    listen_fd_ = -1;
}

void KnockListener::accept_loop() {
    while (running_) {
        sockaddr_in client_addr{};
        socklen_t addr_len = static_cast<socklen_t>(sizeof(client_addr));

        int client = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                             &addr_len, SOCK_CLOEXEC);
        if (client < 0) {
            int err = errno;
            if (!running_) break;
            if (net::is_transient_accept_error(err)) {
                continue;
            }
            if (net::is_resource_accept_error(err)) {
                KG_LOG_WARN("listener", "accept on port " + std::to_string(port_) +
                                        " out of resources: " + std::strerror(err));
            } else {
                KG_LOG_WARN("listener", "accept on port " + std::to_string(port_) +
                                        " failed: " + std::strerror(err));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }

        KnockEvent event;
        event.arrival = std::chrono::steady_clock::now();
        event.port = port_;
        event.source_address = net::peer_address(client_addr);
        close(client);
        accepted_.fetch_add(1);

        if (event.source_address.empty()) continue;

        KG_LOG_DEBUG("listener", "Connection from " + event.source_address +
                                 " on port " + std::to_string(port_));
        try {
            on_knock_(event);
        } catch (const std::exception& e) {
            KG_LOG_ERROR("listener", "Knock handler failed for " + event.source_address +
                                     ": " + e.what());
        }
    }
}

} // namespace kg
