#include "kg_orchestrator.hpp"
#include "kg_logger.hpp"

#include <sstream>
#include <thread>

namespace kg {

std::chrono::steady_clock::duration seconds_to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds));
}

Orchestrator::Orchestrator(GateConfig config, std::shared_ptr<IFirewallBackend> backend)
    : config_(std::move(config))
    , backend_(std::move(backend)) {
    ValidationError err = config_.validate();
    if (err != ValidationError::NONE) {
        throw ConfigError(validation_error_to_string(err));
    }
    if (!backend_) {
        backend_ = make_backend(config_);
    }
    pool_ = std::make_unique<ThreadPool>(config_.firewall_workers);
    revoke_pool_ = std::make_unique<ThreadPool>(config_.firewall_workers);
    gate_ = std::make_unique<FirewallGate>(backend_, *revoke_pool_, config_.revoke_attempts);
    tracker_ = std::make_unique<SequenceTracker>(config_.sequence,
                                                 seconds_to_duration(config_.window_sec));
}

Orchestrator::~Orchestrator() {
    stop();
}

std::shared_ptr<IFirewallBackend> Orchestrator::make_backend(const GateConfig& config) {
    if (config.dry_run) {
        return std::make_shared<DryRunBackend>(config.firewall_chain);
    }
    return std::make_shared<IptablesBackend>(config.firewall_binary, config.firewall_chain);
}

bool Orchestrator::start() {
    if (started_) return true;

    std::istringstream summary(config_.describe());
    for (std::string line; std::getline(summary, line);) {
        KG_LOG_INFO("knockgate", line);
    }

    gate_->ensure_default_block(config_.protected_port);

    for (uint16_t port : config_.sequence) {
        auto listener = std::make_unique<KnockListener>(
            port,
            [this](const KnockEvent& event) { handle_knock(event); },
            config_.bind_address,
            config_.listen_backlog);
        if (!listener->start()) {
            KG_LOG_ERROR("knockgate", "Startup aborted: knock port " + std::to_string(port) +
                                      " unavailable");
            for (auto& l : listeners_) l->stop();
            listeners_.clear();
            return false;
        }
        listeners_.push_back(std::move(listener));
    }

    started_ = true;
    return true;
}

void Orchestrator::handle_knock(const KnockEvent& event) {
    if (!tracker_->register_knock(event.source_address, event.port, event.arrival)) {
        return;
    }

    const std::string address = event.source_address;
    const uint16_t protected_port = config_.protected_port;
    const auto ttl = seconds_to_duration(config_.open_ttl_sec);
    try {
        pool_->post([this, protected_port, address, ttl] {
            gate_->open(protected_port, address, ttl);
        });
    } catch (const std::runtime_error& e) {
        KG_LOG_WARN("knockgate", "Not opening for " + address + ": " + e.what());
    }
}

void Orchestrator::run(const std::atomic<bool>& running) {
    const auto sweep_every = seconds_to_duration(config_.sweep_interval_sec);
    auto next_sweep = std::chrono::steady_clock::now() + sweep_every;

    while (running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (now >= next_sweep) {
            tracker_->purge_expired(now);
            next_sweep = now + sweep_every;
        }
    }
}

void Orchestrator::stop() {
    if (stopped_) return;
    stopped_ = true;

    for (auto& listener : listeners_) {
        listener->stop();
    }

    // Grants first: they may still schedule revokes. Then every revoke
    // still waiting for its TTL runs.
    pool_->shutdown();
    revoke_pool_->shutdown();

    if (started_) {
        GateStats s = gate_->stats();
        KG_LOG_INFO("knockgate", "Stopped: " + std::to_string(s.grants) + " grant(s), " +
                                 std::to_string(s.revokes_run) + " revoke(s) run");
    }
}

std::vector<uint16_t> Orchestrator::listener_ports() const {
    std::vector<uint16_t> ports;
    for (const auto& l : listeners_) {
        ports.push_back(l->port());
    }
    return ports;
}

} // namespace kg
