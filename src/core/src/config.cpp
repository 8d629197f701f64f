#include "kg_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <iomanip>
#include <limits>

namespace kg {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

long parse_long(const std::string& key, const std::string& text) {
    std::string v = trim(text);
    if (v.empty()) {
        throw ConfigError(key + ": empty value, expected an integer");
    }
    errno = 0;
    char* end = nullptr;
    long result = std::strtol(v.c_str(), &end, 10);
    if (errno == ERANGE || end == v.c_str() || *end != '\0') {
        throw ConfigError(key + ": '" + v + "' is not a valid integer");
    }
    return result;
}

double parse_double(const std::string& key, const std::string& text) {
    std::string v = trim(text);
    if (v.empty()) {
        throw ConfigError(key + ": empty value, expected a number");
    }
    errno = 0;
    char* end = nullptr;
    double result = std::strtod(v.c_str(), &end);
    if (errno == ERANGE || end == v.c_str() || *end != '\0') {
        throw ConfigError(key + ": '" + v + "' is not a valid number");
    }
    return result;
}

} // namespace

// ==================== ConfigStore ====================

ConfigStore::ConfigStore(const ConfigStore& other) {
    std::lock_guard<std::mutex> lock(other.mtx_);
    values_ = other.values_;
}

ConfigStore& ConfigStore::operator=(const ConfigStore& other) {
    if (this != &other) {
        std::map<std::string, std::string> copy = other.snapshot();
        std::lock_guard<std::mutex> lock(mtx_);
        values_ = std::move(copy);
    }
    return *this;
}

std::string ConfigStore::get(const std::string& key, const std::string& default_val) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_val;
}

bool ConfigStore::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_.count(key) != 0;
}

long ConfigStore::getInt(const std::string& key, long default_val) const {
    if (!has(key)) return default_val;
    return parse_long(key, get(key));
}

double ConfigStore::getDouble(const std::string& key, double default_val) const {
    if (!has(key)) return default_val;
    return parse_double(key, get(key));
}

bool ConfigStore::getBool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;
    std::string v = trim(get(key));
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ConfigError(key + ": '" + v + "' is not a boolean");
}

void ConfigStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[key] = value;
}

void ConfigStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::map<std::string, std::string> parsed;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        std::string stripped = trim(line);
        // Skip comments and empty lines
        if (stripped.empty() || stripped[0] == '#' || stripped[0] == ';') continue;
        auto pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(line_no) +
                              ": expected 'key = value'");
        }
        std::string key = trim(stripped.substr(0, pos));
        if (key.empty()) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": empty key");
        }
        parsed[key] = trim(stripped.substr(pos + 1));
    }

    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& kv : parsed) {
        values_[kv.first] = kv.second;
    }
}

void ConfigStore::loadDefaults() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_["knock.sequence"] = "1234,5678,9012";
    values_["knock.window_sec"] = "10.0";
    values_["gate.protected_port"] = "2222";
    values_["gate.open_ttl_sec"] = "30.0";
    values_["gate.revoke_attempts"] = "5";
    values_["firewall.binary"] = "iptables";
    values_["firewall.chain"] = "INPUT";
    values_["firewall.dry_run"] = "false";
    values_["firewall.workers"] = "4";
    values_["listener.bind_address"] = "0.0.0.0";
    values_["listener.backlog"] = "200";
    values_["tracker.sweep_interval_sec"] = "30";
    values_["log.level"] = "info";
    values_["log.file"] = "";
    values_["log.console"] = "true";
}

void ConfigStore::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    values_.clear();
}

std::map<std::string, std::string> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return values_;
}

// ==================== Parsing helpers ====================

uint16_t parse_port(const std::string& text) {
    long value = parse_long("port", text);
    if (value < 1 || value > 65535) {
        throw ConfigError("port " + trim(text) + " is outside 1..65535");
    }
    return static_cast<uint16_t>(value);
}

std::vector<uint16_t> parse_port_sequence(const std::string& text) {
    std::vector<uint16_t> ports;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (trim(item).empty()) {
            throw ConfigError("invalid sequence '" + text +
                              "': use comma-separated integers");
        }
        try {
            ports.push_back(parse_port(item));
        } catch (const ConfigError&) {
            throw ConfigError("invalid sequence '" + text +
                              "': use comma-separated integers in 1..65535");
        }
    }
    if (ports.empty()) {
        throw ConfigError("knock sequence is empty");
    }
    return ports;
}

std::string format_port_sequence(const std::vector<uint16_t>& sequence) {
    std::ostringstream oss;
    for (size_t i = 0; i < sequence.size(); ++i) {
        if (i) oss << ',';
        oss << sequence[i];
    }
    return oss.str();
}

// ==================== GateConfig ====================

const char* validation_error_to_string(ValidationError e) noexcept {
    switch (e) {
        case ValidationError::NONE:                       return "ok";
        case ValidationError::EMPTY_SEQUENCE:             return "knock sequence is empty";
        case ValidationError::INVALID_KNOCK_PORT:         return "knock port must be in 1..65535";
        case ValidationError::DUPLICATE_KNOCK_PORT:       return "knock ports must be distinct";
        case ValidationError::INVALID_PROTECTED_PORT:     return "protected port must be in 1..65535";
        case ValidationError::PROTECTED_PORT_IN_SEQUENCE: return "protected port cannot be a knock port";
        case ValidationError::INVALID_WINDOW:             return "sequence window must be in (0, 1e6] seconds";
        case ValidationError::INVALID_TTL:                return "open TTL must be in (0, 1e6] seconds";
        case ValidationError::INVALID_REVOKE_ATTEMPTS:    return "revoke attempts must be in 1..100";
        case ValidationError::INVALID_BACKLOG:            return "listen backlog must be positive";
        case ValidationError::INVALID_WORKERS:            return "firewall workers must be in 1..64";
        case ValidationError::INVALID_SWEEP_INTERVAL:     return "sweep interval must be in (0, 1e6] seconds";
        case ValidationError::MISSING_FIREWALL_BINARY:    return "firewall binary is empty";
        case ValidationError::MISSING_FIREWALL_CHAIN:     return "firewall chain is empty";
        default: return "unknown validation error";
    }
}

namespace {

// Rejects NaN and infinity as well.
bool valid_duration(double seconds) {
    return seconds > 0.0 && seconds <= kMaxDurationSec;
}

int get_int32(const ConfigStore& store, const std::string& key, int default_value) {
    long value = store.getInt(key, default_value);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(key + ": value out of range");
    }
    return static_cast<int>(value);
}

} // namespace

ValidationError GateConfig::validate() const noexcept {
    if (sequence.empty()) return ValidationError::EMPTY_SEQUENCE;
    std::set<uint16_t> seen;
    for (uint16_t p : sequence) {
        if (p == 0) return ValidationError::INVALID_KNOCK_PORT;
        if (!seen.insert(p).second) return ValidationError::DUPLICATE_KNOCK_PORT;
    }
    if (protected_port == 0) return ValidationError::INVALID_PROTECTED_PORT;
    if (seen.count(protected_port)) return ValidationError::PROTECTED_PORT_IN_SEQUENCE;
    if (!valid_duration(window_sec)) return ValidationError::INVALID_WINDOW;
    if (!valid_duration(open_ttl_sec)) return ValidationError::INVALID_TTL;
    if (revoke_attempts < 1 || revoke_attempts > 100) return ValidationError::INVALID_REVOKE_ATTEMPTS;
    if (listen_backlog < 1) return ValidationError::INVALID_BACKLOG;
    if (firewall_workers < 1 || firewall_workers > 64) return ValidationError::INVALID_WORKERS;
    if (!valid_duration(sweep_interval_sec)) return ValidationError::INVALID_SWEEP_INTERVAL;
    if (firewall_binary.empty()) return ValidationError::MISSING_FIREWALL_BINARY;
    if (firewall_chain.empty()) return ValidationError::MISSING_FIREWALL_CHAIN;
    return ValidationError::NONE;
}

GateConfig GateConfig::from_store(const ConfigStore& store) {
    GateConfig cfg;
    cfg.sequence = parse_port_sequence(store.get("knock.sequence", "1234,5678,9012"));
    cfg.window_sec = store.getDouble("knock.window_sec", cfg.window_sec);
    cfg.protected_port = parse_port(store.get("gate.protected_port", "2222"));
    cfg.open_ttl_sec = store.getDouble("gate.open_ttl_sec", cfg.open_ttl_sec);
    cfg.revoke_attempts = get_int32(store, "gate.revoke_attempts", cfg.revoke_attempts);

    cfg.firewall_binary = store.get("firewall.binary", cfg.firewall_binary);
    cfg.firewall_chain = store.get("firewall.chain", cfg.firewall_chain);
    cfg.dry_run = store.getBool("firewall.dry_run", cfg.dry_run);
    long workers = store.getInt("firewall.workers", static_cast<long>(cfg.firewall_workers));
    if (workers < 0) {
        throw ConfigError("firewall.workers: must not be negative");
    }
    cfg.firewall_workers = static_cast<size_t>(workers);

    cfg.bind_address = store.get("listener.bind_address", cfg.bind_address);
    cfg.listen_backlog = get_int32(store, "listener.backlog", cfg.listen_backlog);
    cfg.sweep_interval_sec = store.getDouble("tracker.sweep_interval_sec", cfg.sweep_interval_sec);

    std::string level = store.get("log.level", "info");
    if (!Logger::levelFromString(level, cfg.log_level)) {
        throw ConfigError("log.level: unknown level '" + level + "'");
    }
    cfg.log_file = store.get("log.file", "");
    cfg.log_console = store.getBool("log.console", cfg.log_console);
    return cfg;
}

std::string GateConfig::describe() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    oss << "Knock sequence: " << format_port_sequence(sequence) << "\n"
        << "Protected port: " << protected_port << "\n"
        << "Sequence window: " << window_sec << "s\n"
        << "Open TTL: " << open_ttl_sec << "s\n"
        << "Revoke attempts: " << revoke_attempts << "\n"
        << "Firewall: " << (dry_run ? std::string("dry-run") : firewall_binary)
        << " (chain " << firewall_chain << ", " << firewall_workers << " workers)\n"
        << "Listen: " << bind_address << " (backlog " << listen_backlog << ")\n"
        << "Sweep interval: " << sweep_interval_sec << "s";
    return oss.str();
}

} // namespace kg
