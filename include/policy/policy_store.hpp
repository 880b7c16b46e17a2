#pragma once

#include "core/types.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace redactor {

/**
 * @brief Read side of the policy collaborator
 *
 * Returns the policy with that id regardless of status; deciding whether
 * an inactive or foreign-organization policy is usable is left to the
 * caller (RedactionService maps both to POLICY_NOT_FOUND).
 */
class IPolicyStore {
public:
    virtual ~IPolicyStore() = default;

    [[nodiscard]] virtual std::optional<Policy> find(const std::string& policy_id) const = 0;
};

/**
 * @brief Thread-safe in-memory policy store
 *
 * Readers take a shared lock and receive a copy, so a concurrent
 * replace_all() never invalidates a policy that is being applied.
 */
class InMemoryPolicyStore : public IPolicyStore {
public:
    InMemoryPolicyStore() = default;
    explicit InMemoryPolicyStore(std::vector<Policy> policies);

    [[nodiscard]] std::optional<Policy> find(const std::string& policy_id) const override;

    /// Insert or overwrite a single policy
    void upsert(Policy policy);

    /// Atomically swap the full policy set
    void replace_all(std::vector<Policy> policies);

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Policy> policies_;
};

} // namespace redactor
