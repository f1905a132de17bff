#pragma once

#include "lcars/events/event.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace lcars::events {

// Receive handle for one subscriber. Holds at most `capacity` events; when
// full the oldest event is dropped and the lag counter grows.
class Subscription {
public:
    explicit Subscription(size_t capacity);

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Blocks up to `timeout`; nullopt on timeout or once closed and drained
    std::optional<Event> receive(std::chrono::milliseconds timeout);
    std::optional<Event> try_receive();

    // Events lost since the last call
    uint64_t take_lagged();

    void close();
    bool is_closed() const;
    size_t pending() const;

private:
    friend class EventBus;

    void deliver(const Event& event);

    const size_t capacity_;
    std::deque<Event> queue_;
    uint64_t lagged_;
    bool closed_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

class EventBus {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit EventBus(size_t capacity = DEFAULT_CAPACITY);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Never blocks on subscribers
    void publish(const Event& event);

    std::shared_ptr<Subscription> subscribe();

    size_t subscriber_count() const;
    uint64_t published_count() const;

private:
    const size_t capacity_;
    std::vector<std::weak_ptr<Subscription>> subscribers_;
    uint64_t published_;
    mutable std::mutex mutex_;
};

} // namespace lcars::events
