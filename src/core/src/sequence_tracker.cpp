#include "kg_sequence_tracker.hpp"
#include "kg_logger.hpp"

#include <set>
#include <stdexcept>

namespace kg {

const char* knock_outcome_to_string(KnockOutcome o) noexcept {
    switch (o) {
        case KnockOutcome::IGNORED:       return "IGNORED";
        case KnockOutcome::STARTED:       return "STARTED";
        case KnockOutcome::PROGRESS:      return "PROGRESS";
        case KnockOutcome::COMPLETED:     return "COMPLETED";
        case KnockOutcome::WRONG_RESET:   return "WRONG_RESET";
        case KnockOutcome::EXPIRED_RESET: return "EXPIRED_RESET";
        default: return "UNKNOWN";
    }
}

SequenceTracker::SequenceTracker(std::vector<uint16_t> sequence, Clock::duration window)
    : sequence_(std::move(sequence))
    , window_(window) {
    if (sequence_.empty()) {
        throw std::invalid_argument("knock sequence must not be empty");
    }
    std::set<uint16_t> seen;
    for (uint16_t port : sequence_) {
        if (port == 0) {
            throw std::invalid_argument("knock sequence contains port 0");
        }
        if (!seen.insert(port).second) {
            throw std::invalid_argument("knock sequence contains duplicate port " +
                                        std::to_string(port));
        }
    }
}

bool SequenceTracker::register_knock(const std::string& address, uint16_t port,
                                     Clock::time_point now) {
    return process(address, port, now) == KnockOutcome::COMPLETED;
}

bool SequenceTracker::register_knock(const std::string& address, uint16_t port) {
    return register_knock(address, port, Clock::now());
}

KnockOutcome SequenceTracker::process(const std::string& address, uint16_t port,
                                      Clock::time_point now) {
    Transition t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        t = apply(address, port, now);
    }
    report(address, port, t);
    return t.outcome;
}

// Caller holds mutex_. Creates a fresh state when port is sequence[0].
bool SequenceTracker::arm(const std::string& address, uint16_t port, Clock::time_point now) {
    if (port != sequence_[0]) return false;
    states_[address] = State{1, now};
    return true;
}

SequenceTracker::Transition SequenceTracker::apply(const std::string& address, uint16_t port,
                                                   Clock::time_point now) {
    Transition t;
    auto it = states_.find(address);

    if (it == states_.end()) {
        if (port != sequence_[0]) {
            return t;
        }
        t.step = 1;
        if (sequence_.size() == 1) {
            t.outcome = KnockOutcome::COMPLETED;
            return t;
        }
        arm(address, port, now);
        t.outcome = KnockOutcome::STARTED;
        return t;
    }

    State& state = it->second;

    if (now - state.window_start > window_) {
        states_.erase(it);
        t.outcome = KnockOutcome::EXPIRED_RESET;
        t.rearmed = arm(address, port, now);
        return t;
    }

    const uint16_t expected = sequence_[state.next_index];
    if (port == expected) {
        if (state.next_index + 1 == sequence_.size()) {
            states_.erase(it);
            t.outcome = KnockOutcome::COMPLETED;
            t.step = sequence_.size();
            return t;
        }
        ++state.next_index;
        t.outcome = KnockOutcome::PROGRESS;
        t.step = state.next_index;
        return t;
    }

    // Wrong knock: no partial credit.
    states_.erase(it);
    t.outcome = KnockOutcome::WRONG_RESET;
    t.expected = expected;
    t.rearmed = arm(address, port, now);
    return t;
}

void SequenceTracker::report(const std::string& address, uint16_t port,
                             const Transition& t) const {
    const std::string total = std::to_string(sequence_.size());
    const std::string from = " from " + address + " on " + std::to_string(port);

    switch (t.outcome) {
        case KnockOutcome::IGNORED:
            KG_LOG_DEBUG("tracker", "Ignoring knock" + from + " (no sequence in progress)");
            return;
        case KnockOutcome::STARTED:
        case KnockOutcome::PROGRESS:
            KG_LOG_INFO("tracker", "Knock " + std::to_string(t.step) + "/" + total + from);
            return;
        case KnockOutcome::COMPLETED:
            KG_LOG_INFO("tracker", "Knock " + total + "/" + total + from + " (COMPLETE)");
            return;
        case KnockOutcome::EXPIRED_RESET:
            KG_LOG_INFO("tracker", "Sequence window expired for " + address + " (reset)");
            break;
        case KnockOutcome::WRONG_RESET:
            KG_LOG_INFO("tracker", "Wrong knock" + from + " (expected " +
                                   std::to_string(t.expected) + "). Reset.");
            break;
    }
    if (t.rearmed) {
        KG_LOG_INFO("tracker", "Knock 1/" + total + from);
    }
}

size_t SequenceTracker::purge_expired(Clock::time_point now) {
    size_t purged = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = states_.begin(); it != states_.end();) {
            if (now - it->second.window_start > window_) {
                it = states_.erase(it);
                ++purged;
            } else {
                ++it;
            }
        }
    }
    if (purged > 0) {
        KG_LOG_DEBUG("tracker", "Purged " + std::to_string(purged) + " expired sequence(s)");
    }
    return purged;
}

bool SequenceTracker::is_tracking(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.count(address) != 0;
}

std::optional<size_t> SequenceTracker::progress(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(address);
    if (it == states_.end()) return std::nullopt;
    return it->second.next_index;
}

size_t SequenceTracker::tracked_addresses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

} // namespace kg
