/**
 * @file uid_pool.hpp
 * @brief Distributed pool of sandbox user identities
 *
 * Each live container runs as a UID nobody else holds, so per-user process
 * accounting (RLIMIT_NPROC) never couples two sandboxes, even on different
 * hosts sharing one coordination store.
 *
 * **Protocol**:
 * ```
 * Initialize: SET marker NX -> SADD key first..first+size-1   (once per domain)
 * Acquire:    SPOP key      (poll until a member appears or the budget runs out)
 * Release:    SADD key uid
 * ```
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "warden/coordination/coordination_store.hpp"
#include "warden/utils/cancellation.hpp"

namespace warden {
namespace core {

/// Non-root user identity handed to one container
using IdentityToken = int;

class UidPool;

/**
 * @class UidLease
 * @brief Exclusive, move-only ownership of one IdentityToken
 *
 * The token goes back to the pool exactly once: on Release() or on
 * destruction, whichever comes first.
 */
class UidLease {
public:
    UidLease() = default;
    ~UidLease();

    UidLease(UidLease&& other) noexcept;
    UidLease& operator=(UidLease&& other) noexcept;

    UidLease(const UidLease&) = delete;
    UidLease& operator=(const UidLease&) = delete;

    bool Valid() const { return pool_ != nullptr; }
    IdentityToken Token() const { return token_; }

    /**
     * @brief Return the token now; later calls are no-ops
     */
    void Release();

private:
    friend class UidPool;
    UidLease(UidPool* pool, IdentityToken token) : pool_(pool), token_(token) {}

    UidPool* pool_{nullptr};
    IdentityToken token_{-1};
};

/**
 * @struct UidPoolConfig
 * @brief Range and timing of a pool
 */
struct UidPoolConfig {
    std::string key{"warden:available_uids"};                ///< Available-set key
    IdentityToken first_uid{2000};                           ///< First token
    int pool_size{1000};                                     ///< Number of tokens
    std::chrono::milliseconds acquire_timeout{std::chrono::seconds(60)};  ///< Wait budget
    std::chrono::milliseconds poll_interval{100};            ///< Store polling period
};

/**
 * @class UidPool
 * @brief Hands out identity tokens from a shared available-set
 *
 * Exhaustion is backpressure: Acquire() waits, and only after the whole
 * budget throws PoolExhausted.
 *
 * **Thread Safety**: Thread-safe. The pool must outlive every lease.
 *
 * **Usage Example**:
 * @code
 * coordination::RedisCoordinationStore store("localhost", 6379);
 * UidPool pool(store, UidPoolConfig{});
 * pool.Initialize();
 *
 * UidLease lease = pool.Acquire();
 * spdlog::info("Running as uid {}", lease.Token());
 * // token returns to the pool when lease goes out of scope
 * @endcode
 */
class UidPool {
public:
    UidPool(coordination::CoordinationStore& store, UidPoolConfig config);

    UidPool(const UidPool&) = delete;
    UidPool& operator=(const UidPool&) = delete;

    /**
     * @brief Seed the available-set with the whole range
     *
     * Seeds once per coordination domain, guarded by a marker key; with
     * @p force the set is wiped and re-seeded (tokens held anywhere become
     * available again, so only do this when no sandbox is running).
     *
     * @return true if this call seeded the set
     * @throws StoreError on store failure
     */
    bool Initialize(bool force = false);

    /**
     * @brief Lease a token, waiting up to the acquisition budget
     *
     * @throws PoolExhausted if no token became available in time
     * @throws OperationCancelled if @p cancel fired while waiting
     * @throws StoreError on store failure
     */
    UidLease Acquire(const utils::CancellationToken& cancel = {});

    /**
     * @brief Return @p token to the shared set
     *
     * No-op (logged) for tokens outside the range or not held by this pool
     * instance, so a double release cannot hand one token to two holders.
     */
    void Release(IdentityToken token);

    /**
     * @brief Return @p token regardless of who holds it (crash recovery)
     * @throws std::out_of_range if @p token is outside the pool range
     */
    void ForceRelease(IdentityToken token);

    /**
     * @brief Tokens currently available in the shared set
     */
    std::size_t Available();

    /**
     * @brief Tokens held by this pool instance
     */
    std::size_t HeldLocally() const;

    bool InRange(IdentityToken token) const {
        return token >= config_.first_uid && token < config_.first_uid + config_.pool_size;
    }

    const UidPoolConfig& Config() const { return config_; }

private:
    std::string MarkerKey() const { return config_.key + ":initialized"; }

    coordination::CoordinationStore& store_;
    UidPoolConfig config_;

    mutable std::mutex mutex_;
    std::set<IdentityToken> held_;
};

} // namespace core
} // namespace warden
