/**
 * @file coordination_store.cpp
 * @brief In-process coordination store
 *
 * @date 2025
 */

#include "warden/coordination/coordination_store.hpp"

namespace warden {
namespace coordination {

std::optional<std::string> InMemoryCoordinationStore::PopMember(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sets_.find(key);
    if (it == sets_.end() || it->second.empty()) {
        return std::nullopt;
    }

    std::string member = *it->second.begin();
    it->second.erase(it->second.begin());
    if (it->second.empty()) {
        sets_.erase(it);
    }
    return member;
}

std::size_t InMemoryCoordinationStore::AddMembers(const std::string& key,
                                                  const std::vector<std::string>& members) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t added = 0;
    auto& set = sets_[key];
    for (const auto& member : members) {
        if (set.insert(member).second) {
            ++added;
        }
    }
    return added;
}

std::size_t InMemoryCoordinationStore::MemberCount(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sets_.find(key);
    return it == sets_.end() ? 0 : it->second.size();
}

bool InMemoryCoordinationStore::SetIfAbsent(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return strings_.emplace(key, value).second;
}

void InMemoryCoordinationStore::DeleteKey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sets_.erase(key);
    strings_.erase(key);
}

} // namespace coordination
} // namespace warden
