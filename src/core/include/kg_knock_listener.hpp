#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace kg {

// ===== Knock Event =====

struct KnockEvent {
    std::string source_address;
    uint16_t port = 0;
    std::chrono::steady_clock::time_point arrival;
};

using KnockCallback = std::function<void(const KnockEvent&)>;

/**
 * @brief Accept-and-close listener on one knock port
 *
 * The TCP handshake is the whole signal: every accepted connection is
 * closed at once without reading or writing, then reported. Nothing is
 * read, so a hostile peer cannot stall the loop.
 */
class KnockListener {
public:
    KnockListener(uint16_t port, KnockCallback on_knock,
                  std::string bind_address = "0.0.0.0", int backlog = 200);
    ~KnockListener();

    KnockListener(const KnockListener&) = delete;
    KnockListener& operator=(const KnockListener&) = delete;

    /// Binds, listens and starts the accept thread. False if the socket
    /// could not be set up (see last_error()).
    bool start();

    /// Wakes the accept thread, joins it and closes the socket.
    void stop();

    bool is_running() const { return running_.load(); }

    /// Bound port; resolves an ephemeral request after start().
    uint16_t port() const { return port_; }

    uint64_t knocks_accepted() const { return accepted_.load(); }

    const std::string& last_error() const { return last_error_; }

private:
    void accept_loop();

    uint16_t port_;
    KnockCallback on_knock_;
    std::string bind_address_;
    int backlog_;

    int listen_fd_ = -1;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> accepted_{0};
    std::string last_error_;
};

} // namespace kg
