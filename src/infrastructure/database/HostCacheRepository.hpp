#pragma once

#include "core/types/HostState.hpp"
#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Repository for persisted host state in the host_cache table.
 *
 * Each row holds one host's HostState serialized as a JSON document.
 */
class HostCacheRepository {
public:
    /**
     * @brief Constructs a HostCacheRepository with the given database.
     * @param db Shared pointer to a migrated Database instance.
     */
    explicit HostCacheRepository(std::shared_ptr<Database> db);

    /**
     * @brief Inserts or replaces the row of a host.
     */
    void upsert(const core::HostState& state);

    /**
     * @brief Writes all states in a single transaction.
     */
    void upsertAll(const std::vector<core::HostState>& states);

    void remove(const std::string& hostId);

    std::optional<core::HostState> findById(const std::string& hostId);

    /**
     * @brief Retrieves all stored host states. Rows that fail to parse are skipped.
     */
    std::vector<core::HostState> findAll();

    /**
     * @brief Deletes rows last updated before the cutoff.
     * @return Number of deleted rows.
     */
    int removeOlderThan(std::chrono::system_clock::time_point cutoff);

private:
    std::shared_ptr<Database> db_;
};

} // namespace hostkeeper::infra
