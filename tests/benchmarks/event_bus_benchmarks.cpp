#include <benchmark/benchmark.h>
#include "lcars/events/event_bus.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace lcars::events;

static TransferProgress sample_progress() {
    TransferProgress progress;
    progress.source_id = "btih:c12fe1c06bba254a9dc9f519b335aa7c1367a88a";
    progress.progress = 0.42;
    progress.download_rate = 4 * 1024 * 1024;
    progress.peer_count = 37;
    return progress;
}

static void BM_PublishNoSubscribers(benchmark::State& state) {
    EventBus bus(256);
    Event event = sample_progress();

    for (auto _ : state) {
        bus.publish(event);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PublishNoSubscribers);

// Subscribers never drain, so every publish past capacity drops the oldest
static void BM_PublishFanOut(benchmark::State& state) {
    EventBus bus(256);
    std::vector<std::shared_ptr<Subscription>> subscriptions;
    for (int64_t i = 0; i < state.range(0); ++i) {
        subscriptions.push_back(bus.subscribe());
    }
    Event event = sample_progress();

    for (auto _ : state) {
        bus.publish(event);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_PublishFanOut)->Range(1, 64);

static void BM_PublishReceive(benchmark::State& state) {
    EventBus bus(1024);
    auto subscription = bus.subscribe();
    Event event = TunnelStatsUpdate{1024, 2048, std::nullopt};

    for (auto _ : state) {
        bus.publish(event);
        auto received = subscription->try_receive();
        benchmark::DoNotOptimize(received);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PublishReceive);

static void BM_ConcurrentConsumer(benchmark::State& state) {
    EventBus bus(1024);
    auto subscription = bus.subscribe();
    std::atomic<bool> done{false};

    std::thread consumer([&]() {
        while (!done) {
            auto event = subscription->receive(std::chrono::milliseconds(10));
            benchmark::DoNotOptimize(event);
        }
    });

    Event event = sample_progress();
    for (auto _ : state) {
        bus.publish(event);
    }

    done = true;
    consumer.join();

    state.SetItemsProcessed(state.iterations());
    state.counters["lagged"] = static_cast<double>(subscription->take_lagged());
}
BENCHMARK(BM_ConcurrentConsumer);
