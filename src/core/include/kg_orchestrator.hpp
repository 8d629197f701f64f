#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "kg_config.hpp"
#include "kg_firewall.hpp"
#include "kg_knock_listener.hpp"
#include "kg_sequence_tracker.hpp"
#include "kg_thread_pool.hpp"

namespace kg {

/// Converts fractional seconds from the config into a steady-clock duration.
std::chrono::steady_clock::duration seconds_to_duration(double seconds);

/**
 * @brief Wires knock listeners, the tracker and the firewall gate together
 *
 * The tracker exists from construction; start() installs the
 * default-deny rule and then one listener per sequence port. Completed
 * sequences are handed to the grant pool so a slow backend never
 * holds up a listener thread. Revokes run on a pool of their own, so a
 * slow delete loop for one address cannot delay a grant for another.
 */
class Orchestrator {
public:
    /// Throws ConfigError if config.validate() fails.
    Orchestrator(GateConfig config, std::shared_ptr<IFirewallBackend> backend);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Backend selected by the config: DryRunBackend or IptablesBackend.
    static std::shared_ptr<IFirewallBackend> make_backend(const GateConfig& config);

    /// False when a knock port cannot be bound; nothing is left running.
    bool start();

    /// Blocks until running turns false, sweeping stale tracker state.
    void run(const std::atomic<bool>& running);

    /// Stops listeners, then runs any pending revokes and joins the pool.
    void stop();

    /// Entry point for every listener.
    void handle_knock(const KnockEvent& event);

    const GateConfig& config() const { return config_; }
    const SequenceTracker& tracker() const { return *tracker_; }
    GateStats gate_stats() const { return gate_->stats(); }
    std::vector<uint16_t> listener_ports() const;

private:
    GateConfig config_;
    std::shared_ptr<IFirewallBackend> backend_;
    std::unique_ptr<ThreadPool> pool_;         // grants
    std::unique_ptr<ThreadPool> revoke_pool_;  // TTL revokes
    std::unique_ptr<FirewallGate> gate_;
    std::unique_ptr<SequenceTracker> tracker_;
    std::vector<std::unique_ptr<KnockListener>> listeners_;
    std::atomic<bool> started_{false};
    bool stopped_ = false;
};

} // namespace kg
