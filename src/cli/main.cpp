#include "kg_config.hpp"
#include "kg_logger.hpp"
#include "kg_orchestrator.hpp"
#include "kg_protected_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace kg;

std::atomic<bool> g_running(true);

// ============================================================================
// Signal handler
// ============================================================================

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, cleanup happens in the command loop
    }
}

// ============================================================================
// ArgumentParser
// ============================================================================

class ArgumentParser {
public:
    struct Command {
        std::string name;
        std::string description;
        std::function<int(const std::vector<std::string>&)> handler;
        std::vector<std::string> args_help;
    };

    ArgumentParser(const std::string& prog_name, const std::string& version)
        : prog_name_(prog_name), version_(version) {}

    void add_command(
        const std::string& name,
        const std::string& description,
        std::function<int(const std::vector<std::string>&)> handler,
        const std::vector<std::string>& args_help = {}
    ) {
        commands_[name] = {name, description, handler, args_help};
    }

    int parse_and_execute(int argc, char* argv[]) {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "help" || cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }
        if (cmd == "version" || cmd == "--version" || cmd == "-v") {
            std::cout << prog_name_ << " " << version_ << std::endl;
            return 0;
        }

        auto it = commands_.find(cmd);
        if (it == commands_.end()) {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return it->second.handler(args);
    }

private:
    void print_usage() const {
        std::cout << prog_name_ << " " << version_ << " - port knocking gate\n";
        std::cout << "\nUsage: " << prog_name_ << " <command> [options]\n\n";
        std::cout << "Commands:\n";
        for (const auto& [name, cmd] : commands_) {
            std::cout << "  " << cmd.name;
            for (const auto& arg : cmd.args_help)
                std::cout << " " << arg;
            std::cout << "\n    " << cmd.description << "\n\n";
        }
        std::cout << "  help\n    Show this help message\n\n";
        std::cout << "  version\n    Show version information\n\n";
        std::cout << "Gate options:\n"
                  << "  --config FILE          key = value configuration file\n"
                  << "  --sequence P1,P2,...   knock ports in order (default 1234,5678,9012)\n"
                  << "  --protected-port P     port kept closed by default (default 2222)\n"
                  << "  --window SEC           seconds allowed to complete the sequence (default 10)\n"
                  << "  --ttl SEC              seconds the port stays open after success (default 30)\n"
                  << "  --revoke-attempts N    delete attempts per revoke (default 5)\n"
                  << "  --bind ADDR            listen address (default 0.0.0.0)\n"
                  << "  --log-level LEVEL      trace|debug|info|warn|error|fatal|none\n"
                  << "  --log-file PATH        also append log lines to PATH\n"
                  << "  --dry-run              log firewall commands instead of running them\n";
    }

    std::string prog_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
};

// ============================================================================
// Option handling
// ============================================================================

// Options that take a value, mapped onto configuration keys.
static const std::map<std::string, std::string> kValueOptions = {
    {"--sequence",        "knock.sequence"},
    {"--window",          "knock.window_sec"},
    {"--protected-port",  "gate.protected_port"},
    {"--ttl",             "gate.open_ttl_sec"},
    {"--revoke-attempts", "gate.revoke_attempts"},
    {"--bind",            "listener.bind_address"},
    {"--log-level",       "log.level"},
    {"--log-file",        "log.file"},
};

/// Applies --config first, then command-line overrides. Throws ConfigError.
static GateConfig load_gate_config(const std::vector<std::string>& args) {
    ConfigStore store;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& opt = args[i];
        if (opt == "--dry-run") {
            overrides.emplace_back("firewall.dry_run", "true");
            continue;
        }
        bool is_config = (opt == "--config");
        auto it = kValueOptions.find(opt);
        if (!is_config && it == kValueOptions.end()) {
            throw ConfigError("unknown option '" + opt + "'");
        }
        if (i + 1 >= args.size()) {
            throw ConfigError("option " + opt + " requires a value");
        }
        const std::string& value = args[++i];
        if (is_config) {
            store.loadFromFile(value);
        } else {
            overrides.emplace_back(it->second, value);
        }
    }
    for (const auto& kv : overrides) {
        store.set(kv.first, kv.second);
    }

    GateConfig config = GateConfig::from_store(store);
    ValidationError err = config.validate();
    if (err != ValidationError::NONE) {
        throw ConfigError(validation_error_to_string(err));
    }
    return config;
}

static void apply_logging(const GateConfig& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(config.log_level);
    logger.setConsoleOutput(config.log_console);
    if (!config.log_file.empty() && !logger.setFileOutput(config.log_file)) {
        KG_LOG_WARN("knockgate", "Cannot open log file " + config.log_file);
    }
}

// ============================================================================
// Handlers
// ============================================================================

int handle_run(const std::vector<std::string>& args) {
    GateConfig config;
    try {
        config = load_gate_config(args);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    apply_logging(config);

    Orchestrator orchestrator(config, Orchestrator::make_backend(config));
    if (!orchestrator.start()) {
        return 1;
    }

    KG_LOG_INFO("knockgate", "Gate running. Press Ctrl+C to stop.");
    orchestrator.run(g_running);

    KG_LOG_INFO("knockgate", "Shutdown signal received");
    orchestrator.stop();
    return 0;
}

int handle_check_config(const std::vector<std::string>& args) {
    try {
        GateConfig config = load_gate_config(args);
        std::cout << config.describe() << "\n";
        std::cout << "Configuration OK\n";
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
}

int handle_protected(const std::vector<std::string>& args) {
    uint16_t port = 2222;
    std::string bind_address = "0.0.0.0";
    try {
        for (size_t i = 0; i < args.size(); ++i) {
            if ((args[i] == "--port" || args[i] == "--bind" || args[i] == "--log-level") &&
                i + 1 >= args.size()) {
                throw ConfigError("option " + args[i] + " requires a value");
            }
            if (args[i] == "--port") {
                port = parse_port(args[++i]);
            } else if (args[i] == "--bind") {
                bind_address = args[++i];
            } else if (args[i] == "--log-level") {
                LogLevel level;
                if (!Logger::levelFromString(args[++i], level)) {
                    throw ConfigError("unknown log level '" + args[i] + "'");
                }
                Logger::instance().setLevel(level);
            } else {
                throw ConfigError("unknown option '" + args[i] + "'");
            }
        }
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    ProtectedService service(port, bind_address);
    if (!service.start()) {
        return 1;
    }
    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    service.stop();
    return 0;
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ArgumentParser parser("knockgate", "v1.0.0");

    parser.add_command("run", "Start the knock listeners and guard the protected port",
                       handle_run, {"[options]"});
    parser.add_command("check-config", "Validate options and print the effective configuration",
                       handle_check_config, {"[options]"});
    parser.add_command("protected", "Run the stand-in protected service",
                       handle_protected, {"[--port P]", "[--bind ADDR]", "[--log-level L]"});

    return parser.parse_and_execute(argc, argv);
}
