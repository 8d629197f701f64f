#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <vector>
#include <mutex>
#include <stdexcept>

#include "kg_logger.hpp"

namespace kg {

/// Raised for any malformed startup input (CLI value, config file entry).
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Key/value configuration store
 *
 * Holds raw string values loaded from a `key = value` file and from
 * command-line overrides. Typed getters are strict: a value that does
 * not parse raises ConfigError instead of falling back to the default.
 */
class ConfigStore {
public:
    ConfigStore() { loadDefaults(); }

    ConfigStore(const ConfigStore& other);
    ConfigStore& operator=(const ConfigStore& other);

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const;
    bool has(const std::string& key) const;

    long getInt(const std::string& key, long default_val = 0) const;
    double getDouble(const std::string& key, double default_val = 0.0) const;
    bool getBool(const std::string& key, bool default_val = false) const;

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value);

    // ==================== File I/O ====================
    /// Throws ConfigError when the file cannot be opened or a line has no '='.
    void loadFromFile(const std::string& path);

    void loadDefaults();
    void clear();

    std::map<std::string, std::string> snapshot() const;

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

enum class ValidationError {
    NONE = 0,
    EMPTY_SEQUENCE,
    INVALID_KNOCK_PORT,
    DUPLICATE_KNOCK_PORT,
    INVALID_PROTECTED_PORT,
    PROTECTED_PORT_IN_SEQUENCE,
    INVALID_WINDOW,
    INVALID_TTL,
    INVALID_REVOKE_ATTEMPTS,
    INVALID_BACKLOG,
    INVALID_WORKERS,
    INVALID_SWEEP_INTERVAL,
    MISSING_FIREWALL_BINARY,
    MISSING_FIREWALL_CHAIN
};

const char* validation_error_to_string(ValidationError e) noexcept;

/// Upper bound for every duration setting (window, TTL, sweep interval).
constexpr double kMaxDurationSec = 1e6;

/**
 * @brief Typed configuration of the knock gate
 *
 * Defaults match a stock deployment: knock 1234, 5678, 9012 within
 * ten seconds to open port 2222 for thirty seconds.
 */
struct GateConfig {
    std::vector<uint16_t> sequence{1234, 5678, 9012};
    uint16_t protected_port = 2222;
    double window_sec = 10.0;
    double open_ttl_sec = 30.0;
    int revoke_attempts = 5;

    std::string firewall_binary = "iptables";
    std::string firewall_chain = "INPUT";
    bool dry_run = false;
    // Size of each firewall pool; grants and revokes run on separate pools.
    size_t firewall_workers = 4;

    std::string bind_address = "0.0.0.0";
    int listen_backlog = 200;
    double sweep_interval_sec = 30.0;

    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    bool log_console = true;

    ValidationError validate() const noexcept;

    /// Builds a config from the store; throws ConfigError on unparsable values.
    static GateConfig from_store(const ConfigStore& store);

    /// Multi-line human readable dump used by `check-config` and at startup.
    std::string describe() const;
};

/// Parses "1234,5678,9012". Throws ConfigError on empty or non-numeric items.
std::vector<uint16_t> parse_port_sequence(const std::string& text);

/// Parses a single TCP port in 1..65535. Throws ConfigError otherwise.
uint16_t parse_port(const std::string& text);

std::string format_port_sequence(const std::vector<uint16_t>& sequence);

} // namespace kg
