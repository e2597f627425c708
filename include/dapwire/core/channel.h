#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace dapwire {

// Typed publish/subscribe channel. Any number of independent subscribers may be attached;
// publish() delivers synchronously, in subscription order, on the publishing thread.
// Handlers run without the channel lock held, so they may subscribe or unsubscribe freely.
template <typename T> class Channel {
public:
    using Handler = std::function<void(const T&)>;

private:
    struct Slot {
        uint64_t id;
        std::shared_ptr<const Handler> handler;
    };

    struct State {
        std::mutex mu;
        std::vector<Slot> slots;
        uint64_t nextId{1};
    };

public:
    // Detaches its handler when destroyed or reset(). Outliving the channel is safe.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& other) noexcept
            : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = std::exchange(other.id_, 0);
            }
            return *this;
        }
        ~Subscription() { reset(); }

        void reset() {
            if (auto state = state_.lock()) {
                std::lock_guard<std::mutex> lk(state->mu);
                std::erase_if(state->slots, [this](const Slot& s) { return s.id == id_; });
            }
            state_.reset();
            id_ = 0;
        }

        bool active() const { return id_ != 0 && !state_.expired(); }

    private:
        friend class Channel;
        Subscription(std::weak_ptr<State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        uint64_t id_{0};
    };

    Channel() : state_(std::make_shared<State>()) {}
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    [[nodiscard]] Subscription subscribe(Handler handler) {
        std::lock_guard<std::mutex> lk(state_->mu);
        const uint64_t id = state_->nextId++;
        state_->slots.push_back(Slot{id, std::make_shared<const Handler>(std::move(handler))});
        return Subscription(state_, id);
    }

    void publish(const T& value) const {
        std::vector<std::shared_ptr<const Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            snapshot.reserve(state_->slots.size());
            for (const auto& slot : state_->slots) {
                snapshot.push_back(slot.handler);
            }
        }
        for (const auto& handler : snapshot) {
            if (*handler) {
                (*handler)(value);
            }
        }
    }

    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->slots.size();
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace dapwire
