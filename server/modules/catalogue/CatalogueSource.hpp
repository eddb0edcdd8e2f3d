#pragma once

#include "domain/Catalogue.hpp"

/**
 * @brief Signal row as delivered by the business system, before translation
 */
struct SignalRecord {
    std::string name;
    std::string label;
    std::string kind;                        // signal_type label
    std::optional<int64_t> linearAddress;    // modbus_address
    std::string hierarchicalAddress;         // plc_address, may be empty
    Json::Value value;                       // stored value, null when absent
};

struct ConnectionRecord {
    Connection connection;
    std::vector<SignalRecord> signals;
};

/**
 * @brief Raw catalogue, one fetch worth
 */
struct CatalogueData {
    std::vector<ConnectionRecord> connections;
    std::vector<Action> actions;
};

/**
 * @brief Where the catalogue comes from
 */
class CatalogueSource {
public:
    template<typename T = void> using Task = drogon::Task<T>;

    virtual ~CatalogueSource() = default;

    /**
     * @brief Fetch all enabled connections with their signals, plus actions
     * @throws std::exception on any failure; the loader reports it as CatalogueUnavailableError
     */
    virtual Task<CatalogueData> fetch() = 0;

    virtual std::string describe() const = 0;
};
