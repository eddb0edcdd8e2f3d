#pragma once

#include "CatalogueSource.hpp"
#include "SignalRegistry.hpp"
#include "common/protocol/modbus/Modbus.Utils.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief Fetches the catalogue and publishes it to the registry
 *
 * A failed fetch throws CatalogueUnavailableError and leaves the registry as it
 * was. Bad connections (no host, port 0) and bad signal rows (unknown kind,
 * address out of range, disagreeing addresses) are skipped with a warning;
 * they never fail the whole load.
 */
class CatalogueLoader {
public:
    template<typename T = void> using Task = drogon::Task<T>;
    using SnapshotPtr = SignalRegistry::SnapshotPtr;

    CatalogueLoader(std::shared_ptr<CatalogueSource> source, SignalRegistry& registry, int batchMaxGap = 0)
        : source_(std::move(source)), registry_(registry), batchMaxGap_(batchMaxGap) {}

    ~CatalogueLoader() {
        stopPeriodicRefresh();
    }

    /**
     * @brief Fetch, build and publish a new snapshot
     * @throws CatalogueUnavailableError the registry keeps its previous snapshot
     */
    Task<SnapshotPtr> load() {
        CatalogueData data;
        try {
            data = co_await source_->fetch();
        } catch (const std::exception& e) {
            LOG_ERROR << "[Catalogue] Fetch from " << source_->describe() << " failed: " << e.what();
            throw CatalogueUnavailableError(std::string("Signal catalogue unavailable: ") + e.what());
        }

        uint64_t version = nextVersion_.fetch_add(1) + 1;
        auto previous = registry_.snapshot();
        if (previous->version >= version) {
            // a later load already finished
            co_return previous;
        }

        auto next = buildSnapshot(data, previous, version, batchMaxGap_);
        registry_.swap(next);
        co_return next;
    }

    /** Same as load(); signals that keep their identity keep their value */
    Task<SnapshotPtr> refresh() {
        co_return co_await load();
    }

    // ==================== Periodic refresh ====================

    void startPeriodicRefresh(trantor::EventLoop* loop, int seconds) {
        if (!loop || seconds <= 0) return;
        stopPeriodicRefresh();
        refreshLoop_ = loop;
        refreshTimerId_ = loop->runEvery(static_cast<double>(seconds), [this]() {
            drogon::async_run([this]() -> Task<void> {
                try {
                    co_await refresh();
                } catch (const std::exception& e) {
                    LOG_WARN << "[Catalogue] Periodic refresh failed, keeping v"
                             << registry_.snapshot()->version << ": " << e.what();
                }
            });
        });
        LOG_INFO << "[Catalogue] Periodic refresh every " << seconds << "s";
    }

    void stopPeriodicRefresh() {
        if (refreshLoop_) {
            refreshLoop_->invalidateTimer(refreshTimerId_);
            refreshLoop_ = nullptr;
        }
    }

    // ==================== Snapshot building ====================

    /**
     * @brief Turn raw rows into an indexed snapshot with polling plans
     *
     * A signal whose name, connection, kind and linear address all match an
     * entry of `previous` reuses that entry's slot, so its cached value survives.
     */
    static SnapshotPtr buildSnapshot(const CatalogueData& data, const SnapshotPtr& previous,
                                     uint64_t version, int batchMaxGap = 0) {
        auto snap = std::make_shared<CatalogueSnapshot>();
        snap->version = version;
        snap->loadedAt = TimestampHelper::now();

        std::set<std::string> connectionNames;
        std::set<std::string> signalNames;

        for (const auto& record : data.connections) {
            const auto& conn = record.connection;
            if (!conn.enabled) continue;
            if (conn.host.empty() || conn.port == 0) {
                LOG_WARN << "[Catalogue] Connection '" << conn.name << "' skipped: no usable endpoint ("
                         << (conn.host.empty() ? "<no host>" : conn.host) << ":" << conn.port << ")";
                continue;
            }
            if (conn.name.empty() || !connectionNames.insert(conn.name).second) {
                LOG_WARN << "[Catalogue] Skipping connection with empty or duplicate name '" << conn.name << "'";
                continue;
            }

            ConnectionPlan plan;
            plan.connection = conn;

            for (const auto& row : record.signals) {
                try {
                    Signal signal = buildSignal(conn.name, row);
                    if (!signalNames.insert(signal.name).second) {
                        LOG_WARN << "[Catalogue] Duplicate signal '" << signal.name << "' on "
                                 << conn.name << ", skipped";
                        continue;
                    }
                    signal.slot = carrySlot(previous, signal);
                    if (!signal.slot) {
                        signal.slot = std::make_shared<SignalSlot>(seedValue(signal.kind, row.value));
                    }
                    plan.signals.push_back(snap->signals.size());
                    snap->signals.push_back(std::move(signal));
                } catch (const AppException& e) {
                    LOG_WARN << "[Catalogue] Signal '" << row.name << "' on " << conn.name
                             << " skipped: " << e.what();
                }
            }

            plan.batches = planBatches(snap->signals, plan.signals, batchMaxGap);
            snap->connections.push_back(std::move(plan));
        }

        std::set<std::string> actionNames;
        for (const auto& action : data.actions) {
            if (!actionNames.insert(action.name).second) {
                LOG_WARN << "[Catalogue] Duplicate action '" << action.name << "', skipped";
                continue;
            }
            if (action.trigger == TriggerType::SignalChange && !signalNames.contains(action.signal)) {
                LOG_WARN << "[Catalogue] Action '" << action.name << "' watches unknown signal '"
                         << action.signal << "'";
            }
            snap->actions.push_back(action);
        }

        snap->buildIndexes();
        return snap;
    }

    /**
     * @brief Validate one row and derive its kind and linear address
     *
     * The linear address wins when both are given; the hierarchical one must agree.
     * Coil and contact kinds are normalized to their primary or slave variant.
     * @throws AddressFormatError, UnknownSignalKindError
     */
    static Signal buildSignal(const std::string& connection, const SignalRecord& row) {
        if (row.name.empty()) {
            throw AddressFormatError("Signal row without a name");
        }

        SignalKind declared = AddressTranslator::parseKind(row.kind);

        uint32_t linear = 0;
        if (row.linearAddress) {
            if (*row.linearAddress < 0 || *row.linearAddress > Constants::MAX_LINEAR_ADDRESS) {
                throw AddressFormatError("Linear address " + std::to_string(*row.linearAddress) +
                                         " outside 0.." + std::to_string(Constants::MAX_LINEAR_ADDRESS));
            }
            linear = static_cast<uint32_t>(*row.linearAddress);
        } else if (!row.hierarchicalAddress.empty()) {
            linear = AddressTranslator::parse(row.hierarchicalAddress).linear();
        } else {
            throw AddressFormatError("Signal has neither a linear nor a hierarchical address");
        }

        SignalKind kind = AddressTranslator::classify(declared, linear);
        if (kind != declared) {
            LOG_DEBUG << "[Catalogue] " << row.name << ": " << signalKindToString(declared)
                      << " at " << linear << " is " << signalKindToString(kind);
        }

        // range check for the final kind; the given text must carry the kind's prefix
        std::string derived = AddressTranslator::toHierarchical(kind, linear);
        if (!row.hierarchicalAddress.empty() &&
            AddressTranslator::toLinear(kind, row.hierarchicalAddress) != linear) {
            throw AddressFormatError("Address " + row.hierarchicalAddress + " disagrees with linear " +
                                     std::to_string(linear) + " (" + derived + ")");
        }

        Signal signal;
        signal.name = row.name;
        signal.label = row.label.empty() ? row.name : row.label;
        signal.connection = connection;
        signal.kind = kind;
        signal.linearAddress = linear;
        return signal;
    }

    /**
     * @brief Initial slot value from the stored catalogue value
     * Falls back to false / 0 when the stored value is missing or unusable.
     */
    static SignalValue seedValue(SignalKind kind, const Json::Value& stored) {
        SignalValue fallback = SignalValues::defaultFor(kind);
        if (stored.isNull()) return fallback;

        if (SignalValues::isBool(fallback)) {
            if (stored.isBool()) return stored.asBool();
            if (stored.isNumeric()) return stored.asDouble() != 0.0;
            if (stored.isString()) {
                auto text = stored.asString();
                if (text == "1" || text == "true" || text == "True") return true;
                return false;
            }
            return fallback;
        }

        if (stored.isNumeric()) {
            if (stored.isInt64()) return static_cast<int64_t>(stored.asInt64());
            if (stored.isUInt64()) return static_cast<int64_t>(stored.asUInt64());
            return static_cast<int64_t>(std::llround(stored.asDouble()));
        }
        if (stored.isString()) {
            try {
                return static_cast<int64_t>(std::llround(std::stod(stored.asString())));
            } catch (const std::exception&) {
                return fallback;
            }
        }
        return fallback;
    }

private:
    std::shared_ptr<CatalogueSource> source_;
    SignalRegistry& registry_;
    int batchMaxGap_;
    std::atomic<uint64_t> nextVersion_{0};

    trantor::EventLoop* refreshLoop_ = nullptr;
    trantor::TimerId refreshTimerId_{0};

    static std::shared_ptr<SignalSlot> carrySlot(const SnapshotPtr& previous, const Signal& signal) {
        if (!previous) return nullptr;
        const auto* old = previous->findSignal(signal.name);
        if (old && old->connection == signal.connection && old->kind == signal.kind &&
            old->linearAddress == signal.linearAddress) {
            return old->slot;
        }
        return nullptr;
    }

    /** Read batches: grouped by kind, sorted by address, merged while contiguous */
    static std::vector<modbus::ReadGroup> planBatches(const std::vector<Signal>& signals,
                                                      const std::vector<size_t>& indexes,
                                                      int batchMaxGap) {
        std::vector<modbus::RegisterDef> defs;
        defs.reserve(indexes.size());
        for (size_t index : indexes) {
            const auto& signal = signals[index];
            const auto& info = signal.kindInfo();
            defs.push_back({
                static_cast<int>(signal.kind),
                info.table,
                static_cast<uint16_t>(signal.linearAddress),
                info.quantity,
                index
            });
        }
        if (defs.empty()) return {};
        return modbus::ModbusUtils::mergeRegisters(defs, batchMaxGap, Constants::MAX_REGISTERS_PER_READ);
    }
};
