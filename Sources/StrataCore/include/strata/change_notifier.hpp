#pragma once

#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

enum class change_kind {
    created,
    updated,
    deleted
};

const char* to_string(change_kind kind) noexcept;

/// A committed record change. `payload` is the record as written (created,
/// updated) or as it was just before removal (deleted).
struct change_event {
    std::string structure_name;
    change_kind kind = change_kind::created;
    primary_key_t record_id = 0;
    json payload;
    timestamp_t timestamp{};

    /// {"type": "created", "structure": "...", "data": {...}}
    json to_message() const;
};

namespace detail {

// Bounded FIFO shared by one subscription and the notifier. When full, the
// oldest pending event is discarded and counted.
struct subscriber_channel {
    explicit subscriber_channel(std::string structure, size_t capacity)
        : structure_name(std::move(structure)), capacity(capacity) {}

    void push(const change_event& event);
    void close();

    const std::string structure_name;
    const size_t capacity;

    std::mutex mutex;
    std::condition_variable ready;
    std::deque<change_event> events;
    uint64_t dropped = 0;
    bool closed = false;
};

} // namespace detail

/// Move-only handle on a live subscription. Destroying it unsubscribes.
class subscription {
public:
    subscription() = default;
    subscription(std::shared_ptr<detail::subscriber_channel> channel,
                 std::function<void()> unregister_fn)
        : channel_(std::move(channel)), unregister_(std::move(unregister_fn)) {}

    ~subscription() {
        unsubscribe();
    }

    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;

    subscription(subscription&& other) noexcept
        : channel_(std::move(other.channel_)), unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    subscription& operator=(subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            channel_ = std::move(other.channel_);
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Blocks until an event arrives or the subscription is closed.
    std::optional<change_event> next();
    std::optional<change_event> next(std::chrono::milliseconds timeout);
    std::optional<change_event> try_next();

    /// Takes every pending event without blocking.
    std::vector<change_event> drain();

    /// Events discarded because this subscriber fell behind.
    uint64_t dropped() const;
    size_t pending() const;

    void unsubscribe();

    [[nodiscard]] bool is_active() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept { return is_active(); }

    const std::string& structure_name() const;

    /// Blocking input iteration; ends when the subscription is closed.
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = change_event;
        using difference_type = std::ptrdiff_t;
        using pointer = const change_event*;
        using reference = const change_event&;

        iterator() = default;
        explicit iterator(subscription* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& other) const { return owner_ == other.owner_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            current_ = owner_ ? owner_->next() : std::nullopt;
            if (!current_) owner_ = nullptr;
        }

        subscription* owner_ = nullptr;
        std::optional<change_event> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::shared_ptr<detail::subscriber_channel> channel_;
    std::function<void()> unregister_;
};

/// Fans committed changes out to per-structure subscribers. Publishing never
/// blocks on a slow subscriber.
class change_notifier {
public:
    explicit change_notifier(size_t buffer_capacity = 256);
    ~change_notifier();

    change_notifier(const change_notifier&) = delete;
    change_notifier& operator=(const change_notifier&) = delete;

    subscription subscribe(const std::string& structure_name);

    void publish(const change_event& event);

    size_t subscriber_count(const std::string& structure_name) const;

    size_t buffer_capacity() const noexcept { return capacity_; }

private:
    struct state {
        std::mutex mutex;
        std::unordered_map<std::string,
                           std::map<uint64_t, std::shared_ptr<detail::subscriber_channel>>> channels;
        uint64_t next_id = 1;
    };

    // Subscriptions hold a weak reference so they may outlive the notifier.
    std::shared_ptr<state> state_;
    size_t capacity_;
};

} // namespace strata
