#pragma once

#include "core/types/Definitions.hpp"
#include "core/types/EffectiveConfig.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hostkeeper::infra {

/**
 * @brief Tie-break between groups that set the same key.
 */
enum class GroupMergeOrder {
    LastWins, ///< Later groups in the host's list override earlier ones
    FirstWins ///< Earlier groups override later ones
};

/**
 * @brief Parses "last_wins" / "first_wins". Unknown strings map to LastWins.
 */
GroupMergeOrder groupMergeOrderFromString(const std::string& str);

/**
 * @brief Immutable result of one successful reload.
 */
struct ConfigSnapshot {
    core::Definitions definitions;
    std::map<std::string, core::EffectiveConfig> hosts;
    uint64_t generation{0};
};

/**
 * @brief Computes effective host configuration from templates, groups and host overrides.
 *
 * The resolved configuration is held as a shared_ptr<const ConfigSnapshot>
 * which reloadAll() replaces as a whole. Readers keep whatever snapshot they
 * obtained, so a reload never tears a resolution in progress.
 */
class ConfigResolver {
public:
    using DefinitionSource = std::function<core::Definitions()>;
    using ChangeListener = std::function<void(const std::vector<std::string>& changedHosts)>;

    explicit ConfigResolver(DefinitionSource source,
                            GroupMergeOrder order = GroupMergeOrder::LastWins);

    /**
     * @brief Reparses, validates and resolves every host, then swaps the snapshot.
     * @return Ids of hosts that were added, removed or whose configuration changed.
     * @throws core::ConfigError if the definitions are invalid. The prior snapshot stays active.
     */
    std::vector<std::string> reloadAll();

    /**
     * @brief Returns the effective configuration of a host.
     * @throws core::ConfigError if the host is unknown.
     */
    core::EffectiveConfig resolve(const std::string& hostId) const;

    std::vector<std::string> hostIds() const;
    std::shared_ptr<const ConfigSnapshot> snapshot() const;

    void setMergeOrder(GroupMergeOrder order);
    GroupMergeOrder mergeOrder() const;

    int addChangeListener(ChangeListener listener);
    void removeChangeListener(int id);

    /**
     * @brief Merges overlay on top of base.
     *
     * Module settings are merged per key; version, enabled and is_critical
     * are replaced only when the overlay sets them. Host settings are unioned.
     */
    static core::SettingsLayer mergeLayers(const core::SettingsLayer& base,
                                           const core::SettingsLayer& overlay);

    /**
     * @brief Folds templates, groups and host overrides into the effective configuration.
     *
     * Expects validated definitions.
     */
    static core::EffectiveConfig resolveHost(const core::Definitions& definitions,
                                             const core::HostDefinition& host,
                                             GroupMergeOrder order);

    /**
     * @brief Checks references and validator patterns.
     * @throws core::ConfigError describing the first problem found.
     */
    static void validate(const core::Definitions& definitions);

private:
    void notifyListeners(const std::vector<std::string>& changedHosts);

    DefinitionSource source_;
    GroupMergeOrder order_;

    mutable std::mutex mutex_;
    std::shared_ptr<const ConfigSnapshot> snapshot_;

    std::mutex listenersMutex_;
    std::map<int, ChangeListener> listeners_;
    int nextListenerId_{1};
};

} // namespace hostkeeper::infra
