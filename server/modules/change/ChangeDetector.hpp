#pragma once

#include "SignalPublisher.hpp"
#include "modules/address/SignalCodec.hpp"
#include "modules/catalogue/SignalRegistry.hpp"
#include "modules/command/ActionExecutor.hpp"
#include "modules/event/EventLog.hpp"

/**
 * @brief Turns read results into signal updates
 *
 * For every signal of a batch: decode, compare with the slot, and on a change
 * update the slot, record a Signal Update event, publish the value and fire
 * the signal-change actions. An unchanged value costs one comparison.
 */
class ChangeDetector {
public:
    using SnapshotPtr = SignalRegistry::SnapshotPtr;

    ChangeDetector(SignalPublisher& publisher, EventLog& events, ActionExecutor* actions = nullptr,
                   double tolerance = 0.0)
        : publisher_(publisher), events_(events), actions_(actions), tolerance_(tolerance) {}

    /**
     * @brief Process one successful batch read
     * @return number of signals that changed
     */
    size_t onBatch(const CatalogueSnapshot& snapshot, const modbus::ReadGroup& batch,
                   const modbus::ModbusResponse& response) {
        size_t changed = 0;
        const std::string* connection = nullptr;

        for (const auto& reg : batch.registers) {
            if (reg.tag >= snapshot.signals.size()) continue;
            const Signal& signal = snapshot.signals[reg.tag];
            connection = &signal.connection;

            auto offset = static_cast<uint16_t>(reg.address - batch.startAddress);
            auto value = SignalCodec::decode(signal.kind, offset, response.data);
            if (!value) {
                LOG_WARN << "[Change] " << signal.name << ": payload too short ("
                         << response.data.size() << " bytes)";
                continue;
            }

            auto previous = signal.slot->update(*value, tolerance_);
            if (!previous) continue;

            ++changed;
            events_.record(Event::signalUpdate(signal.connection, signal.name, *previous, *value));
            publisher_.publishSignal(signal.name, *value);
            if (actions_) actions_->onSignalChange(snapshot, signal, *value);
        }

        if (connection) clearFailure(*connection);
        return changed;
    }

    /**
     * @brief A batch read failed
     *
     * One Error event per failure regardless of batch size; a repeat of the
     * same error on the same connection is only logged until a read succeeds.
     */
    void onReadFailure(const std::string& connection, const modbus::ReadGroup& batch, const std::string& error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto [it, inserted] = lastFailure_.try_emplace(connection, error);
            if (!inserted) {
                if (it->second == error) {
                    LOG_DEBUG << "[Change] " << connection << " still failing: " << error;
                    return;
                }
                it->second = error;
            }
        }

        Event event = Event::error(connection, "", error);
        event.message = "Read " + modbus::registerTypeToString(batch.registerType) + " " +
                        std::to_string(batch.startAddress) + "+" + std::to_string(batch.totalQuantity) +
                        " (" + std::to_string(batch.registers.size()) + " signals)";
        events_.record(std::move(event));
    }

    /**
     * @brief Store a value confirmed by a write
     * @return previous value
     *
     * Always republishes; actions fire only when the value actually changed.
     */
    SignalValue applyWrite(const CatalogueSnapshot& snapshot, const Signal& signal, const SignalValue& value) {
        SignalValue previous = signal.slot->set(value);
        events_.record(Event::write(signal.connection, signal.name, previous, value));
        publisher_.publishSignal(signal.name, value);
        if (actions_ && !SignalValues::equals(previous, value, tolerance_)) {
            actions_->onSignalChange(snapshot, signal, value);
        }
        return previous;
    }

    double tolerance() const { return tolerance_; }

private:
    SignalPublisher& publisher_;
    EventLog& events_;
    ActionExecutor* actions_;
    double tolerance_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::string> lastFailure_;

    void clearFailure(const std::string& connection) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!lastFailure_.empty()) lastFailure_.erase(connection);
    }
};
