#pragma once

#include "modules/address/SignalKind.hpp"

/**
 * @brief Last-known value of a signal: bool for digital kinds, integer for registers
 */
using SignalValue = std::variant<bool, int64_t>;

namespace SignalValues {

inline bool isBool(const SignalValue& v) {
    return std::holds_alternative<bool>(v);
}

inline double toDouble(const SignalValue& v) {
    return isBool(v) ? (std::get<bool>(v) ? 1.0 : 0.0)
                     : static_cast<double>(std::get<int64_t>(v));
}

inline Json::Value toJson(const SignalValue& v) {
    if (isBool(v)) return Json::Value(std::get<bool>(v));
    return Json::Value(static_cast<Json::Int64>(std::get<int64_t>(v)));
}

inline std::string toString(const SignalValue& v) {
    if (isBool(v)) return std::get<bool>(v) ? "true" : "false";
    return std::to_string(std::get<int64_t>(v));
}

/**
 * @brief Type-appropriate equality
 * Booleans compare by identity; integers exactly, or within `tolerance` when it is > 0.
 */
inline bool equals(const SignalValue& a, const SignalValue& b, double tolerance = 0.0) {
    if (a.index() != b.index()) return false;
    if (isBool(a)) return std::get<bool>(a) == std::get<bool>(b);

    int64_t x = std::get<int64_t>(a);
    int64_t y = std::get<int64_t>(b);
    if (tolerance <= 0.0) return x == y;
    return std::fabs(static_cast<double>(x) - static_cast<double>(y)) <= tolerance;
}

/** Seed value when the catalogue carries none */
inline SignalValue defaultFor(SignalKind kind) {
    const auto* info = findSignalKindInfo(kind);
    if (info && info->digital) return false;
    return int64_t{0};
}

}  // namespace SignalValues

/**
 * @brief Mutable value cell of one signal
 *
 * Shared by consecutive catalogue snapshots so a value survives a refresh.
 * Every access holds the slot's own mutex, so readers never see a torn value.
 */
class SignalSlot {
public:
    explicit SignalSlot(SignalValue initial) : value_(initial) {}

    SignalValue get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    /**
     * @brief Store `next` unless it equals the current value
     * @return previous value when it changed, nullopt otherwise
     */
    std::optional<SignalValue> update(const SignalValue& next, double tolerance = 0.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (SignalValues::equals(value_, next, tolerance)) {
            return std::nullopt;
        }
        SignalValue previous = value_;
        value_ = next;
        return previous;
    }

    /** Unconditional store, returns the previous value */
    SignalValue set(const SignalValue& next) {
        std::lock_guard<std::mutex> lock(mutex_);
        SignalValue previous = value_;
        value_ = next;
        return previous;
    }

private:
    mutable std::mutex mutex_;
    SignalValue value_;
};
