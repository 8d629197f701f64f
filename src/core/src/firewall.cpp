#include "kg_firewall.hpp"
#include "kg_logger.hpp"
#include "kg_thread_pool.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <stdexcept>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kg {

const char* rule_action_to_string(RuleAction a) noexcept {
    switch (a) {
        case RuleAction::ACCEPT: return "ACCEPT";
        case RuleAction::DROP:   return "DROP";
        default: return "UNKNOWN";
    }
}

namespace {

std::string join_args(const std::string& binary, const std::vector<std::string>& args) {
    std::string line = binary;
    for (const auto& a : args) {
        line += ' ';
        line += a;
    }
    return line;
}

std::string describe_rule(const FirewallRule& rule) {
    std::string s = std::string(rule_action_to_string(rule.action)) + " tcp dport " +
                    std::to_string(rule.dest_port);
    if (!rule.source.empty()) s += " from " + rule.source;
    return s;
}

} // namespace

// ==================== IptablesBackend ====================

IptablesBackend::IptablesBackend(std::string binary, std::string chain)
    : binary_(std::move(binary)), chain_(std::move(chain)) {}

std::vector<std::string> IptablesBackend::build_args(Op op, const std::string& chain,
                                                     const FirewallRule& rule,
                                                     int position) {
    std::vector<std::string> args;
    switch (op) {
        case Op::APPEND:
            args = {"-A", chain};
            break;
        case Op::INSERT:
            args = {"-I", chain, std::to_string(position)};
            break;
        case Op::DELETE:
            args = {"-D", chain};
            break;
    }
    args.push_back("-p");
    args.push_back("tcp");
    if (!rule.source.empty()) {
        args.push_back("-s");
        args.push_back(rule.source);
    }
    args.push_back("--dport");
    args.push_back(std::to_string(rule.dest_port));
    args.push_back("-j");
    args.push_back(rule_action_to_string(rule.action));
    return args;
}

CommandResult IptablesBackend::append(const FirewallRule& rule) {
    return run(build_args(Op::APPEND, chain_, rule));
}

CommandResult IptablesBackend::insert(const FirewallRule& rule, int position) {
    return run(build_args(Op::INSERT, chain_, rule, position));
}

CommandResult IptablesBackend::remove(const FirewallRule& rule) {
    return run(build_args(Op::DELETE, chain_, rule));
}

std::string IptablesBackend::name() const {
    return binary_ + " (chain " + chain_ + ")";
}

CommandResult IptablesBackend::run(const std::vector<std::string>& args) {
    // argv is assembled before fork(); the child only calls
    // async-signal-safe functions before exec.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary_.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return CommandResult::failure(-1, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // Child: exec iptables directly, no shell involved
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execvp(argv[0], argv.data());
        _exit(127);  // exec failed
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return CommandResult::failure(-1, std::string("waitpid failed: ") +
                                                  std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return CommandResult::success();
        if (code == 127) {
            return CommandResult::failure(code, "cannot execute " + binary_);
        }
        return CommandResult::failure(code, join_args(binary_, args) +
                                                " exited with status " + std::to_string(code));
    }
    if (WIFSIGNALED(status)) {
        return CommandResult::failure(-1, join_args(binary_, args) + " killed by signal " +
                                              std::to_string(WTERMSIG(status)));
    }
    return CommandResult::failure(-1, join_args(binary_, args) + " ended abnormally");
}

// ==================== DryRunBackend ====================

DryRunBackend::DryRunBackend(std::string chain) : chain_(std::move(chain)) {}

CommandResult DryRunBackend::append(const FirewallRule& rule) {
    return record(IptablesBackend::build_args(IptablesBackend::Op::APPEND, chain_, rule));
}

CommandResult DryRunBackend::insert(const FirewallRule& rule, int position) {
    return record(IptablesBackend::build_args(IptablesBackend::Op::INSERT, chain_, rule,
                                              position));
}

CommandResult DryRunBackend::remove(const FirewallRule& rule) {
    return record(IptablesBackend::build_args(IptablesBackend::Op::DELETE, chain_, rule));
}

std::string DryRunBackend::name() const {
    return "dry-run (chain " + chain_ + ")";
}

CommandResult DryRunBackend::record(const std::vector<std::string>& args) {
    KG_LOG_INFO("firewall", "[dry-run] " + join_args("iptables", args));
    return CommandResult::success();
}

// ==================== FirewallGate ====================

FirewallGate::FirewallGate(std::shared_ptr<IFirewallBackend> backend,
                           ThreadPool& pool,
                           int revoke_attempts)
    : backend_(std::move(backend))
    , pool_(pool)
    , revoke_attempts_(revoke_attempts < 1 ? 1 : revoke_attempts) {
    if (!backend_) {
        throw std::invalid_argument("FirewallGate requires a backend");
    }
}

bool FirewallGate::check(const CommandResult& result, const char* what,
                         const FirewallRule& rule) {
    if (result.ok) return true;
    backend_failures_.fetch_add(1);
    KG_LOG_DEBUG("firewall", std::string(what) + " " + describe_rule(rule) +
                             " failed: " + result.error);
    return false;
}

void FirewallGate::ensure_default_block(uint16_t protected_port) {
    FirewallRule drop = FirewallRule::drop_all(protected_port);

    // Absence of the old rule is not an error.
    check(backend_->remove(drop), "delete", drop);

    if (!check(backend_->append(drop), "append", drop)) {
        KG_LOG_WARN("firewall", "Could not install default DROP for port " +
                                std::to_string(protected_port) + " via " + backend_->name());
        return;
    }
    KG_LOG_INFO("firewall", "Protected port " + std::to_string(protected_port) +
                            " is blocked by default (" + backend_->name() + " DROP)");
}

void FirewallGate::open(uint16_t protected_port, const std::string& address,
                        std::chrono::steady_clock::duration ttl) {
    double ttl_sec = std::chrono::duration<double>(ttl).count();
    std::ostringstream msg;
    msg << "Opening protected port " << protected_port << " for " << address
        << " (ttl=" << std::fixed << std::setprecision(0) << ttl_sec << "s)";
    KG_LOG_INFO("gate", msg.str());

    FirewallRule allow = FirewallRule::allow_from(protected_port, address);
    if (check(backend_->insert(allow, 1), "insert", allow)) {
        grants_.fetch_add(1);
    } else {
        KG_LOG_WARN("gate", "Grant for " + address + " was not confirmed by the backend");
    }

    // The revoke is scheduled even when the insert reported failure: the
    // rule may still have landed.
    revokes_scheduled_.fetch_add(1);
    try {
        pool_.post_after(ttl, [this, protected_port, address] {
            revoke(protected_port, address);
        });
    } catch (const std::runtime_error&) {
        // Pool already stopping; revoke now rather than leak the rule.
        revoke(protected_port, address);
    }
}

void FirewallGate::revoke(uint16_t protected_port, const std::string& address) {
    KG_LOG_INFO("gate", "Closing protected port " + std::to_string(protected_port) +
                        " for " + address);
    revokes_run_.fetch_add(1);

    FirewallRule allow = FirewallRule::allow_from(protected_port, address);
    int removed = 0;
    // Repeated opens stack duplicate rules; keep deleting.
    for (int i = 0; i < revoke_attempts_; ++i) {
        if (check(backend_->remove(allow), "delete", allow)) {
            ++removed;
        }
    }
    KG_LOG_DEBUG("gate", "Revoke for " + address + " removed " + std::to_string(removed) +
                         " rule(s) in " + std::to_string(revoke_attempts_) + " attempt(s)");
}

GateStats FirewallGate::stats() const {
    GateStats s;
    s.grants = grants_.load();
    s.revokes_scheduled = revokes_scheduled_.load();
    s.revokes_run = revokes_run_.load();
    s.backend_failures = backend_failures_.load();
    return s;
}

} // namespace kg
