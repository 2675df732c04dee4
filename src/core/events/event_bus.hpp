#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace Tether {
namespace Core {

using ListenerId = std::uint64_t;

// Typed publish/subscribe channel. Listeners run in subscription order;
// a listener removed during dispatch is not called for the rest of it.
template <typename... Args>
class EventBus {
public:
    using Handler = std::function<void(Args...)>;

    ListenerId subscribe(Handler handler) {
        ListenerId id = next_id_++;
        listeners_.push_back({id, std::make_shared<Handler>(std::move(handler))});
        return id;
    }

    bool unsubscribe(ListenerId id) {
        auto it = std::find_if(
            listeners_.begin(), listeners_.end(), [id](const Entry& e) { return e.id == id; });
        if (it == listeners_.end())
            return false;
        listeners_.erase(it);
        return true;
    }

    void emit(Args... args) {
        auto snapshot = listeners_;
        for (const auto& entry : snapshot) {
            if (!is_subscribed(entry.id))
                continue;
            (*entry.handler)(args...);
        }
    }

    bool is_subscribed(ListenerId id) const {
        return std::any_of(
            listeners_.begin(), listeners_.end(), [id](const Entry& e) { return e.id == id; });
    }

    size_t listener_count() const {
        return listeners_.size();
    }

    void clear() {
        listeners_.clear();
    }

private:
    struct Entry {
        ListenerId               id;
        std::shared_ptr<Handler> handler;
    };

    std::vector<Entry> listeners_;
    ListenerId         next_id_ = 1;
};

// Unsubscribes on destruction.
template <typename... Args>
class ScopedListener {
public:
    ScopedListener(EventBus<Args...>& bus, typename EventBus<Args...>::Handler handler)
        : bus_(bus), id_(bus.subscribe(std::move(handler))) {
    }
    ~ScopedListener() {
        bus_.unsubscribe(id_);
    }

    ScopedListener(const ScopedListener&)            = delete;
    ScopedListener& operator=(const ScopedListener&) = delete;

private:
    EventBus<Args...>& bus_;
    ListenerId         id_;
};

}  // namespace Core
}  // namespace Tether
