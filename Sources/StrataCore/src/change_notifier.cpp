#include "strata/change_notifier.hpp"
#include "strata/log.hpp"

namespace strata {

const char* to_string(change_kind kind) noexcept {
    switch (kind) {
        case change_kind::created: return "created";
        case change_kind::updated: return "updated";
        case change_kind::deleted: return "deleted";
    }
    return "unknown";
}

json change_event::to_message() const {
    return {
        {"type", to_string(kind)},
        {"structure", structure_name},
        {"data", payload},
    };
}

namespace detail {

void subscriber_channel::push(const change_event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) return;
        if (events.size() >= capacity) {
            events.pop_front();
            ++dropped;
            if ((dropped & (dropped - 1)) == 0) {
                LOG_WARN("notify", "Subscriber on '%s' is behind, %llu event(s) dropped",
                         structure_name.c_str(), static_cast<unsigned long long>(dropped));
            }
        }
        events.push_back(event);
    }
    ready.notify_one();
}

void subscriber_channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        closed = true;
    }
    ready.notify_all();
}

} // namespace detail

// MARK: - subscription

std::optional<change_event> subscription::next() {
    if (!channel_) return std::nullopt;
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->ready.wait(lock, [&] { return !channel_->events.empty() || channel_->closed; });
    if (channel_->events.empty()) return std::nullopt;
    auto event = std::move(channel_->events.front());
    channel_->events.pop_front();
    return event;
}

std::optional<change_event> subscription::next(std::chrono::milliseconds timeout) {
    if (!channel_) return std::nullopt;
    std::unique_lock<std::mutex> lock(channel_->mutex);
    channel_->ready.wait_for(lock, timeout, [&] { return !channel_->events.empty() || channel_->closed; });
    if (channel_->events.empty()) return std::nullopt;
    auto event = std::move(channel_->events.front());
    channel_->events.pop_front();
    return event;
}

std::optional<change_event> subscription::try_next() {
    if (!channel_) return std::nullopt;
    std::lock_guard<std::mutex> lock(channel_->mutex);
    if (channel_->events.empty()) return std::nullopt;
    auto event = std::move(channel_->events.front());
    channel_->events.pop_front();
    return event;
}

std::vector<change_event> subscription::drain() {
    std::vector<change_event> out;
    if (!channel_) return out;
    std::lock_guard<std::mutex> lock(channel_->mutex);
    out.assign(std::make_move_iterator(channel_->events.begin()),
               std::make_move_iterator(channel_->events.end()));
    channel_->events.clear();
    return out;
}

uint64_t subscription::dropped() const {
    if (!channel_) return 0;
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->dropped;
}

size_t subscription::pending() const {
    if (!channel_) return 0;
    std::lock_guard<std::mutex> lock(channel_->mutex);
    return channel_->events.size();
}

const std::string& subscription::structure_name() const {
    static const std::string none;
    return channel_ ? channel_->structure_name : none;
}

void subscription::unsubscribe() {
    if (unregister_) {
        unregister_();
        unregister_ = nullptr;
    }
    if (channel_) {
        channel_->close();
    }
}

// MARK: - change_notifier

change_notifier::change_notifier(size_t buffer_capacity)
    : state_(std::make_shared<state>()), capacity_(buffer_capacity == 0 ? 1 : buffer_capacity) {}

change_notifier::~change_notifier() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto& [_, subscribers] : state_->channels) {
        for (auto& entry : subscribers) {
            entry.second->close();
        }
    }
    state_->channels.clear();
}

subscription change_notifier::subscribe(const std::string& structure_name) {
    auto channel = std::make_shared<detail::subscriber_channel>(structure_name, capacity_);
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->next_id++;
        state_->channels[structure_name][id] = channel;
    }
    LOG_DEBUG("notify", "Subscribed #%llu to '%s'", static_cast<unsigned long long>(id), structure_name.c_str());

    std::weak_ptr<state> weak = state_;
    return subscription(channel, [weak, structure_name, id]() {
        auto s = weak.lock();
        if (!s) return;
        std::lock_guard<std::mutex> lock(s->mutex);
        auto it = s->channels.find(structure_name);
        if (it == s->channels.end()) return;
        it->second.erase(id);
        if (it->second.empty()) {
            s->channels.erase(it);
        }
    });
}

void change_notifier::publish(const change_event& event) {
    std::vector<std::shared_ptr<detail::subscriber_channel>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->channels.find(event.structure_name);
        if (it == state_->channels.end()) return;
        targets.reserve(it->second.size());
        for (const auto& [_, channel] : it->second) {
            targets.push_back(channel);
        }
    }
    for (auto& channel : targets) {
        channel->push(event);
    }
}

size_t change_notifier::subscriber_count(const std::string& structure_name) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->channels.find(structure_name);
    return it == state_->channels.end() ? 0 : it->second.size();
}

} // namespace strata
