#pragma once

#include "common/utils/Constants.hpp"

/**
 * @brief Device session state
 */
enum class SessionState {
    Disconnected,   // not started, or stopped
    Connecting,     // connect in progress
    Connected,      // exchanges accepted
    Error           // I/O failure, reconnect pending
};

inline std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting:   return "connecting";
        case SessionState::Connected:    return "connected";
        case SessionState::Error:        return "error";
    }
    return "disconnected";
}

/**
 * @brief Exponential backoff reconnect policy
 *
 * - delay = base * 2^attempts
 * - +/-jitter random spread
 * - result kept within [base, max]
 * - no retry limit
 */
class ReconnectPolicy {
public:
    struct Options {
        double baseSec = Constants::RECONNECT_BASE_DELAY_SEC;
        double maxSec = Constants::RECONNECT_MAX_DELAY_SEC;
        double jitter = Constants::RECONNECT_JITTER_RATIO;
    };

    /** Returns a value in [-1, 1]; replaced in tests for deterministic delays */
    using JitterSource = std::function<double()>;

    ReconnectPolicy() = default;
    explicit ReconnectPolicy(Options options, JitterSource jitterSource = nullptr)
        : options_(options), jitterSource_(std::move(jitterSource)) {}

    /**
     * @brief Delay before the next attempt (s)
     */
    double getDelay() const {
        double delay = options_.baseSec * std::pow(2.0, static_cast<double>(attempts_));
        delay = (std::min)(delay, options_.maxSec);
        delay *= (1.0 + options_.jitter * nextJitter());
        delay = (std::min)(delay, options_.maxSec);
        return (std::max)(delay, options_.baseSec);
    }

    void recordAttempt() { ++attempts_; }

    /** Connection established or an exchange succeeded */
    void reset() { attempts_ = 0; }

    int attempts() const { return attempts_; }

    const Options& options() const { return options_; }

private:
    Options options_;
    JitterSource jitterSource_;
    int attempts_ = 0;

    double nextJitter() const {
        if (jitterSource_) return std::clamp(jitterSource_(), -1.0, 1.0);
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        return dist(rng);
    }
};

/**
 * @brief Session state machine
 *
 * One instance per DeviceSession; every transition goes through here.
 *
 *   Disconnected →[start]→ Connecting →[connected]→ Connected
 *   Any →[failure]→ Error →[retry]→ Connecting
 *   Any →[stop]→ Disconnected
 */
class SessionStateMachine {
public:
    SessionStateMachine() = default;
    explicit SessionStateMachine(ReconnectPolicy policy) : reconnect_(std::move(policy)) {}

    SessionState state() const { return state_; }
    std::string stateString() const { return sessionStateToString(state_); }

    // ==================== Events ====================

    /** @return true when the state changed */
    bool onStart() {
        return transition(SessionState::Connecting, "start");
    }

    bool onConnected() {
        errorMsg_.clear();
        return transition(SessionState::Connected, "connected");
    }

    bool onFailure(const std::string& reason) {
        errorMsg_ = reason;
        return transition(SessionState::Error, "failure");
    }

    /** Reconnect timer fired */
    bool onRetry() {
        reconnect_.recordAttempt();
        return transition(SessionState::Connecting, "retry");
    }

    bool onStop() {
        reconnect_.reset();
        errorMsg_.clear();
        return transition(SessionState::Disconnected, "stop");
    }

    /** Any good response from the device */
    void onExchangeSucceeded() { reconnect_.reset(); }

    // ==================== Reconnect ====================

    double getReconnectDelay() const { return reconnect_.getDelay(); }
    int reconnectAttempts() const { return reconnect_.attempts(); }
    const std::string& errorMsg() const { return errorMsg_; }

private:
    SessionState state_ = SessionState::Disconnected;
    ReconnectPolicy reconnect_;
    std::string errorMsg_;

    bool transition(SessionState newState, const char* event) {
        if (state_ == newState) return false;
        LOG_DEBUG << "SessionFSM: " << sessionStateToString(state_)
                  << " →[" << event << "]→ " << sessionStateToString(newState);
        state_ = newState;
        return true;
    }
};
