#include "strata/structure_locks.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/type_mapper.hpp"
#include <algorithm>

namespace strata {

std::shared_ptr<std::shared_timed_mutex> structure_locks::mutex_for(const std::string& structure_name) {
    // Keyed by table name so names that map to the same table share a lock.
    auto key = type_mapper::table_name(structure_name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = locks_[key];
    auto m = entry.lock();
    if (!m) {
        m = std::make_shared<std::shared_timed_mutex>();
        entry = m;
    }
    if (locks_.size() >= prune_at_) {
        prune();
        prune_at_ = std::max<size_t>(16, locks_.size() * 2);
    }
    return m;
}

// Drops entries whose mutex no held lock refers to. Caller holds mutex_.
void structure_locks::prune() {
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expired()) {
            it = locks_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t structure_locks::tracked() {
    std::lock_guard<std::mutex> lock(mutex_);
    prune();
    return locks_.size();
}

structure_locks::exclusive_lock structure_locks::exclusive(const std::string& structure_name) {
    exclusive_lock lock(mutex_for(structure_name));
    if (!lock.try_lock_for(timeout_)) {
        LOG_WARN("locks", "Timed out waiting for schema lock on '%s'", structure_name.c_str());
        throw concurrency_error("Timed out waiting for schema lock on '" + structure_name + "'");
    }
    return lock;
}

structure_locks::shared_lock structure_locks::shared(const std::string& structure_name) {
    shared_lock lock(mutex_for(structure_name));
    if (!lock.try_lock_for(timeout_)) {
        LOG_WARN("locks", "Timed out waiting for '%s' while its schema is changing", structure_name.c_str());
        throw concurrency_error("Timed out waiting for structure '" + structure_name + "'");
    }
    return lock;
}

} // namespace strata
