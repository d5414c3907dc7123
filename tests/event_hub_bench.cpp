#include "stagehand/core/lockfree_queue.hpp"
#include "stagehand/event/channel_connection.hpp"
#include "stagehand/event/event_hub.hpp"

#include <memory>
#include <vector>

#include <benchmark/benchmark.h>

using namespace stagehand;

static void BM_MPSCQueuePushPop(benchmark::State& state) {
  BoundedMPSCQueue<int> queue(static_cast<std::size_t>(state.range(0)));

  for (auto _ : state) {
    benchmark::DoNotOptimize(queue.push(1));
    benchmark::DoNotOptimize(queue.try_pop());
  }
  state.SetItemsProcessed(state.iterations());
}

static void BM_EventSerialize(benchmark::State& state) {
  auto ev = events::log("stdout", "compiled successfully in 412ms", "preview",
                        ProjectId{"bench"});

  for (auto _ : state) {
    benchmark::DoNotOptimize(ev.to_sse_frame());
  }
  state.SetItemsProcessed(state.iterations());
}

// Publish fan-out to N channel subscribers, draining between rounds.
static void BM_EventHubPublish(benchmark::State& state) {
  const auto subscribers = static_cast<int>(state.range(0));
  EventHub hub(std::chrono::hours(1));
  ProjectId project{"bench"};

  std::vector<std::shared_ptr<EventChannel>> channels;
  for (int i = 0; i < subscribers; ++i) {
    auto [channel, conn] = make_channel_connection(1024);
    if (!hub.subscribe(project, std::move(conn))) {
      state.SkipWithError("subscribe failed");
      return;
    }
    channels.push_back(channel);
  }

  auto ev = events::message({{"text", "hello"}});
  for (auto _ : state) {
    benchmark::DoNotOptimize(hub.publish(project, ev));
    state.PauseTiming();
    for (auto& ch : channels) {
      while (ch->try_pop()) {
      }
    }
    state.ResumeTiming();
  }
  state.SetItemsProcessed(state.iterations() * subscribers);
}

BENCHMARK(BM_MPSCQueuePushPop)->Arg(64)->Arg(1024);
BENCHMARK(BM_EventSerialize);
BENCHMARK(BM_EventHubPublish)->Arg(1)->Arg(8)->Arg(64);

BENCHMARK_MAIN();
