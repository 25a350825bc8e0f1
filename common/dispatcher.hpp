#pragma once

// ============================================================
// dispatcher.hpp -- Keyed handler registry with RAII unregistration
//
//   Dispatcher<std::string, const Envelope&> d;
//   Subscription s = d.subscribe("offer", [](const Envelope& e) { ... });
//   d.dispatch("offer", env);   // calls the handler
//   s.reset();                  // handler is gone, even mid-dispatch
//
// A Subscription may outlive its Dispatcher; it then does nothing.
// ============================================================

#include "platform.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& o) noexcept : cancel_(std::move(o.cancel_)) {
        o.cancel_ = nullptr;
    }
    Subscription& operator=(Subscription&& o) noexcept {
        if (this != &o) {
            reset();
            cancel_ = std::move(o.cancel_);
            o.cancel_ = nullptr;
        }
        return *this;
    }

    // Unregister now (idempotent)
    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

template<typename Key, typename... Args>
class Dispatcher {
public:
    using Handler = std::function<void(Args...)>;

    Dispatcher() : state_(std::make_shared<State>()) {}

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Subscription subscribe(const Key& key, Handler handler) {
        u64 id;
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            id = state_->next_id++;
            state_->handlers[key][id] = std::make_shared<Handler>(std::move(handler));
        }
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, key, id] {
            auto st = weak.lock();
            if (!st) return;
            std::lock_guard<std::mutex> lk(st->mutex);
            auto it = st->handlers.find(key);
            if (it == st->handlers.end()) return;
            it->second.erase(id);
            if (it->second.empty()) st->handlers.erase(it);
        });
    }

    // Call every handler registered for 'key', in registration order.
    // Handlers may subscribe or unsubscribe while being dispatched to;
    // one removed before its turn is skipped. Returns the number called.
    size_t dispatch(const Key& key, Args... args) {
        std::vector<std::pair<u64, std::shared_ptr<Handler>>> snapshot;
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            auto it = state_->handlers.find(key);
            if (it == state_->handlers.end()) return 0;
            snapshot.assign(it->second.begin(), it->second.end());
        }
        size_t called = 0;
        for (auto& [id, handler] : snapshot) {
            if (!still_registered(key, id)) continue;
            (*handler)(args...);
            ++called;
        }
        return called;
    }

    size_t handler_count(const Key& key) const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        auto it = state_->handlers.find(key);
        return it == state_->handlers.end() ? 0 : it->second.size();
    }

private:
    struct State {
        std::mutex mutex;
        u64        next_id{1};
        std::map<Key, std::map<u64, std::shared_ptr<Handler>>> handlers;
    };

    bool still_registered(const Key& key, u64 id) const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        auto it = state_->handlers.find(key);
        return it != state_->handlers.end() && it->second.count(id) > 0;
    }

    std::shared_ptr<State> state_;
};
