/**
 * @file coordination_store.hpp
 * @brief Shared key-value store used for identity bookkeeping
 *
 * Only atomic set primitives are required: popping an arbitrary member
 * removes it for exactly one caller, so two processes can never obtain the
 * same member. No check-then-set sequences are ever built on top.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden {
namespace coordination {

/**
 * @class CoordinationStore
 * @brief Interface to the shared store
 *
 * Implementations throw core::StoreError on I/O or protocol failures.
 */
class CoordinationStore {
public:
    virtual ~CoordinationStore() = default;

    /**
     * @brief Atomically remove and return an arbitrary member of set @p key
     * @return The member, or empty if the set is empty or missing
     */
    virtual std::optional<std::string> PopMember(const std::string& key) = 0;

    /**
     * @brief Add @p members to set @p key
     * @return Number of members that were not present before
     */
    virtual std::size_t AddMembers(const std::string& key,
                                   const std::vector<std::string>& members) = 0;

    /**
     * @brief Cardinality of set @p key (0 when missing)
     */
    virtual std::size_t MemberCount(const std::string& key) = 0;

    /**
     * @brief Set string @p key to @p value unless it already exists
     * @return true if this call created the key
     */
    virtual bool SetIfAbsent(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Remove @p key of any type; missing keys are ignored
     */
    virtual void DeleteKey(const std::string& key) = 0;
};

/**
 * @class InMemoryCoordinationStore
 * @brief Process-local store for single-host deployments and tests
 *
 * **Thread Safety**: Thread-safe (one mutex around all state).
 */
class InMemoryCoordinationStore : public CoordinationStore {
public:
    std::optional<std::string> PopMember(const std::string& key) override;
    std::size_t AddMembers(const std::string& key,
                           const std::vector<std::string>& members) override;
    std::size_t MemberCount(const std::string& key) override;
    bool SetIfAbsent(const std::string& key, const std::string& value) override;
    void DeleteKey(const std::string& key) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::set<std::string>> sets_;
    std::map<std::string, std::string> strings_;
};

} // namespace coordination
} // namespace warden
