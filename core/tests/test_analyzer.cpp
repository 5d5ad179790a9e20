#include "causeway/analyzer.hpp"
#include "causeway/tracker.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace causeway;

namespace {

/// Hand-built chain: events[i] starts at `starts[i]` and is a child of
/// events[parents[i]] (the root has parent -1).
CausalityChain make_chain(ChainId id, const std::vector<uint64_t> &starts,
                          const std::vector<int> &parents) {
  CausalityChain chain;
  chain.id = id;
  for (size_t i = 0; i < starts.size(); ++i) {
    CausalEvent ev;
    ev.id = id * 100 + i + 1;
    ev.chain_id = id;
    ev.type = i == 0 ? CausalEventType::UserAction : CausalEventType::ApiCall;
    ev.description = "e" + std::to_string(i);
    ev.timing.start_time = starts[i];
    if (parents[i] >= 0) {
      auto p = static_cast<uint32_t>(parents[i]);
      ev.parent = p;
      ev.metadata.depth = chain.events[p].metadata.depth + 1;
      chain.events[p].children.push_back(static_cast<uint32_t>(i));
    }
    chain.metadata.max_depth =
        std::max(chain.metadata.max_depth, ev.metadata.depth);
    chain.events.push_back(std::move(ev));
  }
  chain.metadata.start_time = starts.front();
  chain.metadata.event_count = chain.events.size();
  return chain;
}

void complete(CausalEvent &ev, uint64_t duration) {
  ev.timing.duration = duration;
  ev.timing.end_time = ev.timing.start_time + duration;
}

} // namespace

// ============================================================================
// Filters
// ============================================================================

TEST(Analyzer, EmptyFilterMatchesEverything) {
  auto chain = make_chain(1, {10}, {-1});
  EXPECT_TRUE(matches(chain, ChainFilter{}));
}

TEST(Analyzer, FilterByRootType) {
  auto chain = make_chain(1, {10, 20}, {-1, 0});
  ChainFilter f;
  f.root_type = CausalEventType::UserAction;
  EXPECT_TRUE(matches(chain, f));
  f.root_type = CausalEventType::ApiCall; // only a descendant has this type
  EXPECT_FALSE(matches(chain, f));
}

TEST(Analyzer, FilterByStartRangeIsInclusive) {
  auto chain = make_chain(1, {500}, {-1});
  ChainFilter f;
  f.start_range = TimeRange{500, 500};
  EXPECT_TRUE(matches(chain, f));
  f.start_range = TimeRange{501, 1000};
  EXPECT_FALSE(matches(chain, f));
  f.start_range = TimeRange{0, 499};
  EXPECT_FALSE(matches(chain, f));
}

TEST(Analyzer, FilterByTagsMatchesAnyOverlap) {
  auto chain = make_chain(1, {10}, {-1});
  chain.metadata.tags = {"checkout", "mobile"};

  ChainFilter f;
  f.tags = std::vector<std::string>{"desktop", "mobile"};
  EXPECT_TRUE(matches(chain, f));
  f.tags = std::vector<std::string>{"desktop"};
  EXPECT_FALSE(matches(chain, f));
}

TEST(Analyzer, FilterByErrorPresence) {
  auto clean = make_chain(1, {10, 20}, {-1, 0});
  auto failed = make_chain(2, {10, 20}, {-1, 0});
  failed.events[1].metadata.error = EventError{"boom", "test"};

  ChainFilter f;
  f.has_error = true;
  EXPECT_FALSE(matches(clean, f));
  EXPECT_TRUE(matches(failed, f));
  f.has_error = false;
  EXPECT_TRUE(matches(clean, f));
  EXPECT_FALSE(matches(failed, f));
}

TEST(Analyzer, TrackerQueriesApplyFilterInCreationOrder) {
  TrackerOptions opts;
  opts.enable_cleanup_timer = false;
  CausalityTracker tracker(opts);

  EventAttributes ui;
  ui.tags = {"ui"};
  ChainId a = tracker.start_chain(CausalEventType::UserAction, "a", {}, ui);
  tracker.start_chain(CausalEventType::SystemEvent, "b");
  ChainId c = tracker.start_chain(CausalEventType::UserAction, "c", {}, ui);

  ChainFilter f;
  f.tags = std::vector<std::string>{"ui"};
  auto result = tracker.get_chains(f);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].id, a);
  EXPECT_EQ(result[1].id, c);
  EXPECT_EQ(tracker.get_chains().size(), 3u);
}

// ============================================================================
// Timeline
// ============================================================================

TEST(Analyzer, TimelineSortsByStartTimeStably) {
  // Slot order: root(0), x(30), y(10), z(30)
  auto chain = make_chain(1, {0, 30, 10, 30}, {-1, 0, 0, 2});
  complete(chain.events[2], 5);

  auto timeline = build_timeline(chain);
  ASSERT_EQ(timeline.size(), 4u);
  EXPECT_EQ(timeline[0].event.id, chain.events[0].id);
  EXPECT_EQ(timeline[1].event.id, chain.events[2].id);
  EXPECT_EQ(timeline[2].event.id, chain.events[1].id);
  EXPECT_EQ(timeline[3].event.id, chain.events[3].id);

  EXPECT_EQ(timeline[1].duration.value_or(0), 5u);
  EXPECT_FALSE(timeline[2].duration.has_value());
  EXPECT_EQ(timeline[1].depth, 1u);
  EXPECT_EQ(timeline[3].depth, 2u);
  EXPECT_EQ(timeline[1].children,
            (std::vector<EventId>{chain.events[3].id}));
  EXPECT_EQ(timeline[0].children.size(), 2u);
}

TEST(Analyzer, UnknownChainYieldsEmptyResults) {
  TrackerOptions opts;
  opts.enable_cleanup_timer = false;
  CausalityTracker tracker(opts);

  EXPECT_TRUE(tracker.get_chain_timeline(77).empty());
  EXPECT_FALSE(tracker.export_chain(77).has_value());

  PerformanceImpact impact = tracker.get_chain_performance_impact(77);
  EXPECT_EQ(impact.total_duration, 0u);
  EXPECT_FALSE(impact.slowest_event.has_value());
  EXPECT_EQ(impact.error_count, 0u);
  EXPECT_DOUBLE_EQ(impact.average_event_duration, 0.0);
}

// ============================================================================
// Performance impact
// ============================================================================

TEST(Analyzer, PerformanceOverCompletedEventsOnly) {
  auto chain = make_chain(1, {0, 10, 20, 30}, {-1, 0, 1, 1});
  complete(chain.events[1], 40);
  complete(chain.events[2], 100);
  // events[0] and events[3] never complete
  chain.events[3].metadata.error = EventError{"timeout", "network"};
  chain.metadata.total_duration = 500;

  PerformanceImpact impact = performance_impact(chain);
  EXPECT_EQ(impact.total_duration, 500u);
  ASSERT_TRUE(impact.slowest_event.has_value());
  EXPECT_EQ(impact.slowest_event->id, chain.events[2].id);
  EXPECT_EQ(impact.error_count, 1u);
  EXPECT_DOUBLE_EQ(impact.average_event_duration, 70.0);
}

TEST(Analyzer, SlowestEventTieGoesToEarliest) {
  auto chain = make_chain(1, {0, 10, 20}, {-1, 0, 0});
  complete(chain.events[1], 60);
  complete(chain.events[2], 60);

  PerformanceImpact impact = performance_impact(chain);
  ASSERT_TRUE(impact.slowest_event.has_value());
  EXPECT_EQ(impact.slowest_event->id, chain.events[1].id);
}

TEST(Analyzer, ZeroDurationStillCountsAsCompleted) {
  auto chain = make_chain(1, {0, 10}, {-1, 0});
  complete(chain.events[1], 0);

  PerformanceImpact impact = performance_impact(chain);
  ASSERT_TRUE(impact.slowest_event.has_value());
  EXPECT_EQ(impact.slowest_event->id, chain.events[1].id);
  EXPECT_DOUBLE_EQ(impact.average_event_duration, 0.0);
}

TEST(Analyzer, OpenChainHasZeroTotalDuration) {
  auto chain = make_chain(1, {0}, {-1});
  EXPECT_EQ(performance_impact(chain).total_duration, 0u);
  EXPECT_FALSE(performance_impact(chain).slowest_event.has_value());
}

// ============================================================================
// Export
// ============================================================================

TEST(Analyzer, ExportBundlesChainTimelineAndPerformance) {
  TrackerOptions opts;
  opts.enable_cleanup_timer = false;
  CausalityTracker tracker(opts);

  ChainId c = tracker.start_chain(CausalEventType::UserAction, "click");
  EventId api = tracker.add_event(CausalEventType::ApiCall, "GET /items");
  tracker.complete_event(api, EventError{"503", "http"});
  tracker.end_chain(c);

  auto snapshot = tracker.export_chain(c);
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_EQ(snapshot->chain.id, c);
  EXPECT_EQ(snapshot->timeline.size(), 2u);
  EXPECT_EQ(snapshot->performance.error_count, 1u);
  EXPECT_TRUE(snapshot->chain.is_ended());

  // Snapshots are detached from the store.
  tracker.clear();
  EXPECT_EQ(snapshot->chain.events.size(), 2u);
}
