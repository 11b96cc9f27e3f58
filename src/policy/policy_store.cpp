#include "policy/policy_store.hpp"
#include "catalog/table_descriptor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace tablegate {

PolicyStore::PolicyStore(std::string default_schema)
    : default_schema_(std::move(default_schema)),
      snapshot_(std::make_shared<const Snapshot>()) {}

void PolicyStore::load_policies(const std::vector<Policy>& policies) {
    auto next = build_snapshot(policies);
    snapshot_.store(std::move(next), std::memory_order_release);
}

void PolicyStore::reload_policies(const std::vector<Policy>& policies) {
    std::lock_guard<std::mutex> lock(reload_mutex_);

    auto next = build_snapshot(policies);
    const size_t count = next->policies.size();
    snapshot_.store(std::move(next), std::memory_order_release);
    utils::log::info(std::format("Policy store reloaded: {} enabled policies", count));
}

Result<std::vector<Policy>> PolicyStore::policies_for(const std::string& table_name, Operation op) {
    const auto name = QualifiedName::parse(table_name, default_schema_);
    const auto snapshot = snapshot_.load(std::memory_order_acquire);

    std::vector<Policy> matched;
    for (const auto& policy : snapshot->policies) {
        if (policy.applies_to(op) && policy_targets_table(policy, name.schema, name.table)) {
            matched.push_back(policy);
        }
    }
    return Result<std::vector<Policy>>::ok(std::move(matched));
}

Result<bool> PolicyStore::table_has_policies(const std::string& table_name) {
    const auto name = QualifiedName::parse(table_name, default_schema_);
    const auto snapshot = snapshot_.load(std::memory_order_acquire);

    const bool any = std::any_of(snapshot->policies.begin(), snapshot->policies.end(),
        [&](const Policy& p) { return policy_targets_table(p, name.schema, name.table); });
    return Result<bool>::ok(any);
}

size_t PolicyStore::policy_count() const {
    return snapshot_.load(std::memory_order_acquire)->policies.size();
}

void PolicyStore::clear() {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    snapshot_.store(std::make_shared<const Snapshot>(), std::memory_order_release);
}

std::shared_ptr<const PolicyStore::Snapshot> PolicyStore::build_snapshot(
    const std::vector<Policy>& policies) {
    auto snapshot = std::make_shared<Snapshot>();
    for (const auto& policy : policies) {
        if (policy.is_enabled) {
            snapshot->policies.push_back(policy);
        }
    }
    std::stable_sort(snapshot->policies.begin(), snapshot->policies.end(),
        [](const Policy& a, const Policy& b) { return a.id < b.id; });
    return snapshot;
}

} // namespace tablegate
