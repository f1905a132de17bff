#include "lcars/events/event_bus.hpp"
#include "lcars/core/logger.hpp"
#include <algorithm>
#include <utility>

namespace lcars::events {

Subscription::Subscription(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1))
    , lagged_(0)
    , closed_(false) {
}

std::optional<Event> Subscription::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> Subscription::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }

    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

uint64_t Subscription::take_lagged() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::exchange(lagged_, 0);
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool Subscription::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void Subscription::deliver(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            lagged_++;
        }
        queue_.push_back(event);
    }
    available_.notify_one();
}

EventBus::EventBus(size_t capacity)
    : capacity_(capacity == 0 ? DEFAULT_CAPACITY : capacity)
    , published_(0) {
}

void EventBus::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    published_++;

    // Deliver under the bus lock so concurrent publishers interleave whole events
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
        auto subscriber = it->lock();
        if (!subscriber || subscriber->is_closed()) {
            it = subscribers_.erase(it);
            continue;
        }
        subscriber->deliver(event);
        ++it;
    }

    LOG_TRACE("Published {} to {} subscribers", event_name(event), subscribers_.size());
}

std::shared_ptr<Subscription> EventBus::subscribe() {
    auto subscription = std::make_shared<Subscription>(capacity_);

    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
        [](const auto& weak) {
            auto subscriber = weak.lock();
            return subscriber && !subscriber->is_closed();
        }));
}

uint64_t EventBus::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

}
