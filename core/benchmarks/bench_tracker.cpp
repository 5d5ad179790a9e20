// ===========================================================================
// Causality Tracker: hot-path and sweep costs
// ---------------------------------------------------------------------------
// Claims under test:
//   - add_event() on the active chain is O(1) amortized
//   - start_chain() stays flat past the cap (opportunistic sweep amortizes)
//   - cleanup() of an expired store is linear in the chain count
//   - get_chain_timeline() cost scales with chain length, not store size
//
// Methodology:
//   - Sweeper disabled; every sweep is explicit
//   - Store pre-populated to max_chains_in_memory where relevant
// ===========================================================================

#include "causeway/tracker.hpp"
#include <atomic>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <memory>
#include <string>

namespace {

causeway::TrackerOptions bench_options(size_t max_chains, size_t max_length) {
  causeway::TrackerOptions opts;
  opts.enable_cleanup_timer = false;
  opts.max_chains_in_memory = max_chains;
  opts.max_chain_length = max_length;
  return opts;
}

} // namespace

// ===========================================================================
// add_event on the active chain
// ===========================================================================
static void BM_AddEvent(benchmark::State &state) {
  causeway::CausalityTracker tracker(bench_options(50, 1'000'000));
  tracker.start_chain(causeway::CausalEventType::UserAction, "root");

  for (auto _ : state) {
    auto id = tracker.add_event(causeway::CausalEventType::StateChange, "tick");
    benchmark::DoNotOptimize(id);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AddEvent);

// ===========================================================================
// add + complete pair (the with_causality shape)
// ===========================================================================
static void BM_AddCompleteEvent(benchmark::State &state) {
  causeway::CausalityTracker tracker(bench_options(50, 1'000'000));
  tracker.start_chain(causeway::CausalEventType::UserAction, "root");

  for (auto _ : state) {
    auto id = tracker.add_event(causeway::CausalEventType::ApiCall, "call");
    tracker.complete_event(id);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AddCompleteEvent);

// ===========================================================================
// start_chain past the cap
// ===========================================================================
static void BM_StartChainAtCapacity(benchmark::State &state) {
  const auto cap = static_cast<size_t>(state.range(0));
  causeway::CausalityTracker tracker(bench_options(cap, 100));

  for (auto _ : state) {
    auto id = tracker.start_chain(causeway::CausalEventType::UserAction, "c");
    benchmark::DoNotOptimize(id);
  }
  state.counters["ChainsLive"] =
      benchmark::Counter(static_cast<double>(tracker.chain_count()));
}
BENCHMARK(BM_StartChainAtCapacity)->Arg(50)->Arg(500)->Arg(5000);

// ===========================================================================
// Fixture: store of N chains, all expired and swept each iteration
// ===========================================================================
class CleanupFixture : public benchmark::Fixture {
public:
  std::shared_ptr<std::atomic<uint64_t>> now =
      std::make_shared<std::atomic<uint64_t>>(1);
  std::unique_ptr<causeway::CausalityTracker> tracker;

  void SetUp(benchmark::State &state) override {
    const auto n = static_cast<size_t>(state.range(0));
    // Cap well above N so only the age pass does work.
    auto opts = bench_options(n * 2, 100);
    auto clock = now;
    opts.clock = [clock]() { return clock->load(); };
    tracker = std::make_unique<causeway::CausalityTracker>(opts);
  }

  void TearDown(benchmark::State &) override { tracker.reset(); }
};

BENCHMARK_DEFINE_F(CleanupFixture, ExpireAll)(benchmark::State &state) {
  const auto n = static_cast<size_t>(state.range(0));
  size_t expired = 0;

  for (auto _ : state) {
    state.PauseTiming();
    for (size_t i = 0; i < n; ++i)
      tracker->start_chain(causeway::CausalEventType::UserAction, "c");
    now->fetch_add(60'000'000); // past the 30s default
    state.ResumeTiming();

    expired += tracker->cleanup().expired;
  }
  state.counters["Expired"] = benchmark::Counter(
      static_cast<double>(expired), benchmark::Counter::kAvgIterations);
}
BENCHMARK_REGISTER_F(CleanupFixture, ExpireAll)->Arg(100)->Arg(1000)->Arg(10000);

// ===========================================================================
// Timeline construction
// ===========================================================================
static void BM_ChainTimeline(benchmark::State &state) {
  const auto length = static_cast<size_t>(state.range(0));
  causeway::CausalityTracker tracker(bench_options(50, length + 1));
  auto chain = tracker.start_chain(causeway::CausalEventType::UserAction, "root");
  for (size_t i = 1; i < length; ++i)
    tracker.add_event(causeway::CausalEventType::Render, "paint");

  for (auto _ : state) {
    auto timeline = tracker.get_chain_timeline(chain);
    benchmark::DoNotOptimize(timeline);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_ChainTimeline)->Range(8, 4096)->Complexity();

BENCHMARK_MAIN();
