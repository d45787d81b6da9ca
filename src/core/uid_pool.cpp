/**
 * @file uid_pool.cpp
 * @brief Implementation of the distributed UID pool
 *
 * @date 2025
 */

#include "warden/core/uid_pool.hpp"

#include "warden/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace warden {
namespace core {

// ============================================================================
// LEASE
// ============================================================================

UidLease::~UidLease() {
    Release();
}

UidLease::UidLease(UidLease&& other) noexcept
    : pool_(other.pool_)
    , token_(other.token_) {
    other.pool_ = nullptr;
    other.token_ = -1;
}

UidLease& UidLease::operator=(UidLease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        token_ = other.token_;
        other.pool_ = nullptr;
        other.token_ = -1;
    }
    return *this;
}

void UidLease::Release() {
    if (pool_ == nullptr) {
        return;
    }
    UidPool* pool = pool_;
    pool_ = nullptr;
    try {
        pool->Release(token_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to return uid {} to the pool: {}", token_, e.what());
    }
}

// ============================================================================
// POOL
// ============================================================================

UidPool::UidPool(coordination::CoordinationStore& store, UidPoolConfig config)
    : store_(store)
    , config_(std::move(config)) {
    if (config_.pool_size <= 0) {
        throw std::invalid_argument("UID pool size must be positive");
    }
    if (config_.first_uid <= 0) {
        throw std::invalid_argument("UID pool must not include root");
    }
}

bool UidPool::Initialize(bool force) {
    if (force) {
        spdlog::warn("Re-seeding UID pool {}", config_.key);
        store_.DeleteKey(config_.key);
        store_.DeleteKey(MarkerKey());
    }

    if (!store_.SetIfAbsent(MarkerKey(), "1")) {
        spdlog::debug("UID pool {} already initialized", config_.key);
        return false;
    }

    std::vector<std::string> members;
    members.reserve(static_cast<std::size_t>(config_.pool_size));
    for (int i = 0; i < config_.pool_size; ++i) {
        members.push_back(std::to_string(config_.first_uid + i));
    }
    store_.AddMembers(config_.key, members);

    spdlog::info("Initialized UID pool {} with uids {}..{}", config_.key,
                 config_.first_uid, config_.first_uid + config_.pool_size - 1);
    return true;
}

UidLease UidPool::Acquire(const utils::CancellationToken& cancel) {
    const auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;

    while (true) {
        if (cancel.IsCancelled()) {
            throw OperationCancelled("UID acquisition cancelled");
        }

        if (auto member = store_.PopMember(config_.key)) {
            IdentityToken token = -1;
            try {
                token = std::stoi(*member);
            } catch (const std::logic_error&) {
                spdlog::error("Discarding malformed member '{}' of {}", *member, config_.key);
                continue;
            }
            if (!InRange(token)) {
                spdlog::error("Discarding out-of-range uid {} from {}", token, config_.key);
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                held_.insert(token);
            }
            spdlog::debug("Acquired uid {}", token);
            return UidLease(this, token);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw PoolExhausted("No UID available in " + config_.key + " after " +
                                std::to_string(config_.acquire_timeout.count()) + "ms");
        }

        auto wait = std::min<std::chrono::steady_clock::duration>(config_.poll_interval,
                                                                  deadline - now);
        if (cancel.WaitUntil(now + wait)) {
            throw OperationCancelled("UID acquisition cancelled");
        }
    }
}

void UidPool::Release(IdentityToken token) {
    if (!InRange(token)) {
        spdlog::warn("Ignoring release of uid {} outside the pool range", token);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (held_.erase(token) == 0) {
            spdlog::warn("Ignoring release of uid {} not held by this pool", token);
            return;
        }
    }

    try {
        store_.AddMembers(config_.key, {std::to_string(token)});
    } catch (const std::exception&) {
        // Keep the token accounted as held so a retry is still possible.
        std::lock_guard<std::mutex> lock(mutex_);
        held_.insert(token);
        throw;
    }
    spdlog::debug("Released uid {}", token);
}

void UidPool::ForceRelease(IdentityToken token) {
    if (!InRange(token)) {
        throw std::out_of_range("uid " + std::to_string(token) + " is outside the pool range");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(token);
    }
    store_.AddMembers(config_.key, {std::to_string(token)});
    spdlog::info("Force-released uid {}", token);
}

std::size_t UidPool::Available() {
    return store_.MemberCount(config_.key);
}

std::size_t UidPool::HeldLocally() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.size();
}

} // namespace core
} // namespace warden
