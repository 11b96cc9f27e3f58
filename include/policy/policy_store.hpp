#pragma once

#include "policy/ipolicy_store.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tablegate {

/**
 * @brief In-memory policy store
 *
 * Holds an immutable snapshot of policies, fed from a TOML policy file
 * (PolicyLoader) or from a full read of the registry table.
 *
 * Thread-safety: Hot-reloadable via RCU (atomic shared_ptr). Readers never
 * block; reload builds the new snapshot offline and swaps it in.
 */
class PolicyStore : public IPolicyStore {
public:
    explicit PolicyStore(std::string default_schema = "public");

    /**
     * @brief Load policies into the store
     *
     * Disabled policies are kept out of the snapshot.
     */
    void load_policies(const std::vector<Policy>& policies);

    /**
     * @brief Hot reload policies (RCU update, single writer)
     */
    void reload_policies(const std::vector<Policy>& policies);

    [[nodiscard]] Result<std::vector<Policy>> policies_for(
        const std::string& table_name, Operation op) override;

    [[nodiscard]] Result<bool> table_has_policies(const std::string& table_name) override;

    /**
     * @brief Number of enabled policies in the current snapshot
     */
    [[nodiscard]] size_t policy_count() const;

    /**
     * @brief Drop every policy
     */
    void clear();

private:
    struct Snapshot {
        std::vector<Policy> policies;   // Enabled only, ordered by id
    };

    static std::shared_ptr<const Snapshot> build_snapshot(const std::vector<Policy>& policies);

    const std::string default_schema_;

    // RCU: readers load the snapshot atomically, writers build offline and swap
    std::atomic<std::shared_ptr<const Snapshot>> snapshot_;

    // Single writer
    mutable std::mutex reload_mutex_;
};

} // namespace tablegate
