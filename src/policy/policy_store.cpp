#include "policy/policy_store.hpp"

#include <mutex>

namespace redactor {

InMemoryPolicyStore::InMemoryPolicyStore(std::vector<Policy> policies) {
    replace_all(std::move(policies));
}

std::optional<Policy> InMemoryPolicyStore::find(const std::string& policy_id) const {
    std::shared_lock lock(mutex_);
    const auto it = policies_.find(policy_id);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryPolicyStore::upsert(Policy policy) {
    std::unique_lock lock(mutex_);
    auto id = policy.id;
    policies_.insert_or_assign(std::move(id), std::move(policy));
}

void InMemoryPolicyStore::replace_all(std::vector<Policy> policies) {
    std::unordered_map<std::string, Policy> fresh;
    fresh.reserve(policies.size());
    for (auto& policy : policies) {
        auto id = policy.id;
        fresh.insert_or_assign(std::move(id), std::move(policy));
    }

    std::unique_lock lock(mutex_);
    policies_.swap(fresh);
}

size_t InMemoryPolicyStore::size() const {
    std::shared_lock lock(mutex_);
    return policies_.size();
}

} // namespace redactor
