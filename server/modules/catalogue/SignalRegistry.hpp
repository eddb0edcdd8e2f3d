#pragma once

#include "domain/Catalogue.hpp"

/**
 * @brief Registry of connections and signals, published by copy-and-swap
 *
 * Readers take a shared_ptr to the current snapshot and keep using it for as
 * long as they need; a refresh builds a complete new snapshot and swaps the
 * pointer under the write lock. Nobody ever sees a half-built catalogue.
 */
class SignalRegistry {
public:
    using SnapshotPtr = std::shared_ptr<const CatalogueSnapshot>;
    using ChangeListener = std::function<void(const SnapshotPtr& previous, const SnapshotPtr& current)>;

    SignalRegistry() : current_(std::make_shared<const CatalogueSnapshot>()) {}

    SnapshotPtr snapshot() const {
        std::shared_lock lock(mutex_);
        return current_;
    }

    /**
     * @brief Publish a new snapshot and notify listeners (outside the lock)
     */
    void swap(SnapshotPtr next) {
        SnapshotPtr previous;
        {
            std::unique_lock lock(mutex_);
            previous = std::move(current_);
            current_ = next;
        }

        LOG_INFO << "[Registry] Catalogue v" << next->version << " published: "
                 << next->connections.size() << " connections, "
                 << next->signals.size() << " signals, "
                 << next->actions.size() << " actions";

        std::vector<ChangeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(listenerMutex_);
            listeners = listeners_;
        }
        for (const auto& listener : listeners) {
            try {
                listener(previous, next);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Registry] Change listener failed: " << e.what();
            }
        }
    }

    void addListener(ChangeListener listener) {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listeners_.push_back(std::move(listener));
    }

    /** A catalogue has been loaded at least once */
    bool loaded() const {
        return snapshot()->version > 0;
    }

    std::optional<SignalValue> valueOf(const std::string& signal) const {
        auto snap = snapshot();
        const auto* entry = snap->findSignal(signal);
        if (!entry) return std::nullopt;
        return entry->value();
    }

private:
    mutable std::shared_mutex mutex_;
    SnapshotPtr current_;

    std::mutex listenerMutex_;
    std::vector<ChangeListener> listeners_;
};
