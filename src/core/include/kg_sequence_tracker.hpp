#pragma once

/**
 * @file kg_sequence_tracker.hpp
 * @brief Per-address progress through the knock sequence
 *
 * An address starts tracking when it knocks sequence[0] and must then
 * knock every following port exactly once, in order, before the window
 * measured from that first knock runs out. Any wrong port resets the
 * address (re-arming it when the wrong port is sequence[0]); an expired
 * window resets it before the knock is evaluated.
 *
 * All listener threads share one tracker. A single mutex serializes
 * every registration, and nothing but the map update happens under it.
 */

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kg {

enum class KnockOutcome {
    IGNORED,      // no state, port is not sequence[0]
    STARTED,      // first port matched, state created
    PROGRESS,     // expected port matched, waiting for more
    COMPLETED,    // final port matched, state removed
    WRONG_RESET,  // unexpected port, state removed (maybe re-armed)
    EXPIRED_RESET // window elapsed, state removed (maybe re-armed)
};

const char* knock_outcome_to_string(KnockOutcome o) noexcept;

class SequenceTracker {
public:
    using Clock = std::chrono::steady_clock;

    /// Throws std::invalid_argument for an empty sequence, port 0 or duplicates.
    SequenceTracker(std::vector<uint16_t> sequence, Clock::duration window);

    SequenceTracker(const SequenceTracker&) = delete;
    SequenceTracker& operator=(const SequenceTracker&) = delete;

    /// True exactly once per completed sequence for this address.
    bool register_knock(const std::string& address, uint16_t port, Clock::time_point now);
    bool register_knock(const std::string& address, uint16_t port);

    /// Same transition, reporting what happened.
    KnockOutcome process(const std::string& address, uint16_t port, Clock::time_point now);

    /// Drops every state whose window has elapsed; returns how many.
    size_t purge_expired(Clock::time_point now);

    bool is_tracking(const std::string& address) const;

    /// Number of ports already matched, if the address is mid-sequence.
    std::optional<size_t> progress(const std::string& address) const;

    size_t tracked_addresses() const;

    const std::vector<uint16_t>& sequence() const { return sequence_; }
    Clock::duration window() const { return window_; }

private:
    struct State {
        size_t next_index;
        Clock::time_point window_start;
    };

    // Result of one transition, logged after the lock is released.
    struct Transition {
        KnockOutcome outcome = KnockOutcome::IGNORED;
        size_t step = 0;
        uint16_t expected = 0;
        bool rearmed = false;
    };

    Transition apply(const std::string& address, uint16_t port, Clock::time_point now);
    bool arm(const std::string& address, uint16_t port, Clock::time_point now);
    void report(const std::string& address, uint16_t port, const Transition& t) const;

    const std::vector<uint16_t> sequence_;
    const Clock::duration window_;

    std::unordered_map<std::string, State> states_;
    mutable std::mutex mutex_;
};

} // namespace kg
