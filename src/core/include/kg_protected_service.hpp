#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace kg {

/**
 * @brief Stand-in for the service behind the gate
 *
 * Greets every peer with a fixed line and hangs up. Whether a peer can
 * reach it at all is decided by the firewall, not by this class.
 */
class ProtectedService {
public:
    static constexpr const char* kGreeting =
        "Protected service reached. Port knocking worked.\n";

    explicit ProtectedService(uint16_t port = 2222,
                              std::string bind_address = "0.0.0.0",
                              int backlog = 50);
    ~ProtectedService();

    ProtectedService(const ProtectedService&) = delete;
    ProtectedService& operator=(const ProtectedService&) = delete;

    bool start();
    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }
    uint64_t connections_served() const { return served_.load(); }
    const std::string& last_error() const { return last_error_; }

private:
    void serve_loop();

    uint16_t port_;
    std::string bind_address_;
    int backlog_;

    int listen_fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> served_{0};
    std::string last_error_;
};

} // namespace kg
