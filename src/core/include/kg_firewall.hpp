#ifndef KG_FIREWALL_HPP
#define KG_FIREWALL_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kg {

class ThreadPool;

enum class RuleAction {
    ACCEPT,
    DROP
};

const char* rule_action_to_string(RuleAction a) noexcept;

/**
 * @brief Inbound TCP filter rule on one destination port
 *
 * An empty source matches every address (the default-deny rule).
 */
struct FirewallRule {
    uint16_t dest_port = 0;
    std::string source;
    RuleAction action = RuleAction::DROP;

    static FirewallRule drop_all(uint16_t port) {
        return FirewallRule{port, "", RuleAction::DROP};
    }

    static FirewallRule allow_from(uint16_t port, const std::string& address) {
        return FirewallRule{port, address, RuleAction::ACCEPT};
    }
};

/// Outcome of one backend command. Failures are expected churn, never thrown.
struct CommandResult {
    bool ok = false;
    int exit_status = -1;
    std::string error;

    static CommandResult success() { return CommandResult{true, 0, ""}; }
    static CommandResult failure(int status, const std::string& err) {
        return CommandResult{false, status, err};
    }
};

/**
 * @brief Abstract packet-filter control interface
 *
 * Implementations must be callable from several threads at once; the
 * gate never serializes backend calls.
 */
class IFirewallBackend {
public:
    virtual ~IFirewallBackend() = default;

    /// Adds the rule at the end of the chain (lowest priority).
    virtual CommandResult append(const FirewallRule& rule) = 0;

    /// Adds the rule at a 1-based chain position (1 = evaluated first).
    virtual CommandResult insert(const FirewallRule& rule, int position) = 0;

    /// Deletes one occurrence of a matching rule.
    virtual CommandResult remove(const FirewallRule& rule) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief iptables(8) backend
 *
 * Each command is a fork + execvp of the configured binary. No shell is
 * involved, and the child's stdio is redirected to /dev/null.
 */
class IptablesBackend : public IFirewallBackend {
public:
    enum class Op { APPEND, INSERT, DELETE };

    explicit IptablesBackend(std::string binary = "iptables",
                             std::string chain = "INPUT");

    CommandResult append(const FirewallRule& rule) override;
    CommandResult insert(const FirewallRule& rule, int position) override;
    CommandResult remove(const FirewallRule& rule) override;
    std::string name() const override;

    /// argv (without the binary itself) for one command.
    static std::vector<std::string> build_args(Op op, const std::string& chain,
                                               const FirewallRule& rule,
                                               int position = 1);

private:
    CommandResult run(const std::vector<std::string>& args);

    std::string binary_;
    std::string chain_;
};

/// Logs the iptables command it would have run and reports success.
class DryRunBackend : public IFirewallBackend {
public:
    explicit DryRunBackend(std::string chain = "INPUT");

    CommandResult append(const FirewallRule& rule) override;
    CommandResult insert(const FirewallRule& rule, int position) override;
    CommandResult remove(const FirewallRule& rule) override;
    std::string name() const override;

private:
    CommandResult record(const std::vector<std::string>& args);

    std::string chain_;
};

struct GateStats {
    uint64_t grants = 0;
    uint64_t revokes_scheduled = 0;
    uint64_t revokes_run = 0;
    uint64_t backend_failures = 0;
};

/**
 * @brief Converts completed knock sequences into temporary allow rules
 *
 * Owns the default-deny posture of the protected port. Every open()
 * inserts its own ACCEPT rule and schedules its own revoke; re-opens for
 * an address that is already open are not coalesced.
 */
class FirewallGate {
public:
    FirewallGate(std::shared_ptr<IFirewallBackend> backend,
                 ThreadPool& pool,
                 int revoke_attempts = 5);

    FirewallGate(const FirewallGate&) = delete;
    FirewallGate& operator=(const FirewallGate&) = delete;

    /// Best-effort delete of a prior DROP rule, then append a fresh one.
    void ensure_default_block(uint16_t protected_port);

    /// Inserts the ACCEPT rule at position 1 and schedules its revoke.
    void open(uint16_t protected_port, const std::string& address,
              std::chrono::steady_clock::duration ttl);

    GateStats stats() const;

private:
    void revoke(uint16_t protected_port, const std::string& address);
    bool check(const CommandResult& result, const char* what,
               const FirewallRule& rule);

    std::shared_ptr<IFirewallBackend> backend_;
    ThreadPool& pool_;
    int revoke_attempts_;

    std::atomic<uint64_t> grants_{0};
    std::atomic<uint64_t> revokes_scheduled_{0};
    std::atomic<uint64_t> revokes_run_{0};
    std::atomic<uint64_t> backend_failures_{0};
};

} // namespace kg

#endif // KG_FIREWALL_HPP
