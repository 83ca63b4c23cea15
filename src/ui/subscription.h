#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace ui {

// RAII registration handle. Destroying (or reset()-ing) it unregisters the
// callback; after that the callback is never invoked again.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe)
        : unsubscribe_(std::move(unsubscribe)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : unsubscribe_(std::move(other.unsubscribe_)) {
        other.unsubscribe_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            unsubscribe_ = std::move(other.unsubscribe_);
            other.unsubscribe_ = nullptr;
        }
        return *this;
    }

    void reset() {
        auto fn = std::move(unsubscribe_);
        unsubscribe_ = nullptr;
        if (fn) fn();
    }

    bool active() const { return static_cast<bool>(unsubscribe_); }

private:
    std::function<void()> unsubscribe_;
};

// Single-threaded event fan-out. Callbacks may drop their own (or any other)
// subscription while an event is being delivered; dropped callbacks that have
// not run yet are skipped.
template <typename Event>
class EventEmitter {
public:
    using Callback = std::function<void(const Event&)>;

    EventEmitter() : state_(std::make_shared<State>()) {}

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    [[nodiscard]] Subscription subscribe(Callback cb) {
        uint64_t id = state_->nextId++;
        state_->callbacks.emplace(id, std::move(cb));
        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id] {
            if (auto state = weak.lock()) {
                state->callbacks.erase(id);
            }
        });
    }

    void emit(const Event& event) {
        // Hold the state so a callback that destroys the emitter's owner
        // does not pull the map out from under the loop.
        auto state = state_;
        std::vector<uint64_t> ids;
        ids.reserve(state->callbacks.size());
        for (const auto& [id, _] : state->callbacks) ids.push_back(id);

        for (uint64_t id : ids) {
            auto it = state->callbacks.find(id);
            if (it == state->callbacks.end()) continue;
            Callback cb = it->second;
            cb(event);
        }
    }

    size_t subscriber_count() const { return state_->callbacks.size(); }

private:
    struct State {
        uint64_t nextId = 1;
        std::map<uint64_t, Callback> callbacks;
    };

    std::shared_ptr<State> state_;
};

}  // namespace ui
