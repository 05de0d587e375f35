#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace strata {

/// A held structure lock. Shares ownership of its mutex so the registry can
/// forget structures nobody is using.
template <typename Lock>
class structure_lock {
public:
    structure_lock() = default;
    explicit structure_lock(std::shared_ptr<std::shared_timed_mutex> mutex)
        : mutex_(std::move(mutex)), lock_(*mutex_, std::defer_lock) {}

    structure_lock(structure_lock&&) noexcept = default;
    structure_lock& operator=(structure_lock&& other) noexcept {
        lock_ = std::move(other.lock_);  // releases the old mutex while we still own it
        mutex_ = std::move(other.mutex_);
        return *this;
    }

    bool try_lock_for(std::chrono::milliseconds timeout) { return lock_.try_lock_for(timeout); }
    void unlock() { lock_.unlock(); }
    bool owns_lock() const noexcept { return lock_.owns_lock(); }

private:
    std::shared_ptr<std::shared_timed_mutex> mutex_;  // must outlive lock_
    Lock lock_;
};

/// Reader/writer lock per structure. Schema changes take the exclusive side,
/// record operations the shared side; different structures never contend.
/// Waits are bounded and surface concurrency_error on timeout.
class structure_locks {
public:
    using exclusive_lock = structure_lock<std::unique_lock<std::shared_timed_mutex>>;
    using shared_lock = structure_lock<std::shared_lock<std::shared_timed_mutex>>;

    explicit structure_locks(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
        : timeout_(timeout) {}

    exclusive_lock exclusive(const std::string& structure_name);
    shared_lock shared(const std::string& structure_name);

    std::chrono::milliseconds timeout() const { return timeout_; }

    /// Structures with a lock currently held or awaited.
    size_t tracked();

private:
    std::shared_ptr<std::shared_timed_mutex> mutex_for(const std::string& structure_name);
    void prune();

    std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<std::shared_timed_mutex>> locks_;
    size_t prune_at_ = 16;
    std::chrono::milliseconds timeout_;
};

} // namespace strata
