#include "causeway/causeway_c_api.h"
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

// ============================================================================
// C API: error codes, lifecycle, caller-allocated buffers
// ============================================================================

class CApiTest : public ::testing::Test {
protected:
  causeway_tracker_t *tracker = nullptr;

  void SetUp() override {
    causeway_options_t opts{};
    opts.disable_cleanup_timer = 1;
    ASSERT_EQ(causeway_tracker_create(&opts, &tracker), CAUSEWAY_OK);
    ASSERT_NE(tracker, nullptr);
  }

  void TearDown() override {
    EXPECT_EQ(causeway_tracker_destroy(tracker), CAUSEWAY_OK);
  }
};

TEST(CApi, VersionAndNullHandles) {
  EXPECT_EQ(std::string(causeway_version()), "0.1.0");
  EXPECT_EQ(causeway_tracker_create(nullptr, nullptr), CAUSEWAY_ERR_NULL_PTR);
  EXPECT_EQ(causeway_tracker_destroy(nullptr), CAUSEWAY_OK);

  uint64_t id = 0;
  EXPECT_EQ(causeway_start_chain(nullptr, 0, "x", &id), CAUSEWAY_ERR_NULL_PTR);
  size_t count = 0;
  EXPECT_EQ(causeway_chain_count(nullptr, &count), CAUSEWAY_ERR_NULL_PTR);
}

TEST(CApi, DefaultOptionsStartSweeper) {
  causeway_tracker_t *tracker = nullptr;
  ASSERT_EQ(causeway_tracker_create(nullptr, &tracker), CAUSEWAY_OK);
  EXPECT_EQ(causeway_tracker_destroy(tracker), CAUSEWAY_OK);
}

TEST(CApi, ZeroedOptionsKeepSweeperRunning) {
  causeway_options_t opts{};
  opts.max_chain_duration_ms = 20;
  opts.cleanup_interval_ms = 10;
  causeway_tracker_t *tracker = nullptr;
  ASSERT_EQ(causeway_tracker_create(&opts, &tracker), CAUSEWAY_OK);

  uint64_t chain = 0;
  ASSERT_EQ(causeway_start_chain(tracker, CAUSEWAY_EVENT_USER_ACTION, "tap",
                                 &chain),
            CAUSEWAY_OK);

  size_t count = 1;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (std::chrono::steady_clock::now() < deadline) {
    ASSERT_EQ(causeway_chain_count(tracker, &count), CAUSEWAY_OK);
    if (count == 0)
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(count, 0u);
  EXPECT_EQ(causeway_tracker_destroy(tracker), CAUSEWAY_OK);
}

TEST_F(CApiTest, ChainLifecycle) {
  uint64_t chain = 0;
  ASSERT_EQ(causeway_start_chain(tracker, CAUSEWAY_EVENT_USER_ACTION,
                                 "click-save", &chain),
            CAUSEWAY_OK);
  ASSERT_NE(chain, 0u);

  uint64_t current = 0;
  ASSERT_EQ(causeway_current_chain(tracker, &current), CAUSEWAY_OK);
  EXPECT_EQ(current, chain);

  uint64_t api = 0;
  ASSERT_EQ(causeway_add_event(tracker, CAUSEWAY_EVENT_API_CALL, "POST /save",
                               0, 0, &api),
            CAUSEWAY_OK);
  ASSERT_EQ(causeway_complete_event(tracker, api, "timeout"), CAUSEWAY_OK);
  ASSERT_EQ(causeway_end_chain(tracker, chain), CAUSEWAY_OK);

  causeway_chain_summary_t summary{};
  ASSERT_EQ(causeway_get_chain_summary(tracker, chain, &summary), CAUSEWAY_OK);
  EXPECT_EQ(summary.chain_id, chain);
  EXPECT_EQ(summary.event_count, 2u);
  EXPECT_EQ(summary.max_depth, 1u);
  EXPECT_EQ(summary.is_ended, 1);
  EXPECT_EQ(summary.has_error, 1);
  EXPECT_NE(summary.root_event_id, 0u);

  causeway_performance_t perf{};
  ASSERT_EQ(causeway_get_performance(tracker, chain, &perf), CAUSEWAY_OK);
  EXPECT_EQ(perf.error_count, 1u);
  EXPECT_EQ(perf.slowest_event_id, api);

  ASSERT_EQ(causeway_current_chain(tracker, &current), CAUSEWAY_OK);
  EXPECT_EQ(current, 0u);
}

TEST_F(CApiTest, ErrorCodesForBadIds) {
  uint64_t chain = 0, ev = 0;
  ASSERT_EQ(causeway_start_chain(tracker, CAUSEWAY_EVENT_USER_ACTION, "root",
                                 &chain),
            CAUSEWAY_OK);

  EXPECT_EQ(causeway_add_event(tracker, CAUSEWAY_EVENT_API_CALL, "x", 999, 0,
                               &ev),
            CAUSEWAY_ERR_CHAIN_NOT_FOUND);
  EXPECT_EQ(causeway_add_event(tracker, CAUSEWAY_EVENT_API_CALL, "x", chain,
                               999, &ev),
            CAUSEWAY_ERR_EVENT_NOT_FOUND);
  EXPECT_EQ(causeway_add_event(tracker, 99, "x", chain, 0, &ev),
            CAUSEWAY_ERR_INVALID_ARG);

  causeway_chain_summary_t summary{};
  EXPECT_EQ(causeway_get_chain_summary(tracker, 999, &summary),
            CAUSEWAY_ERR_CHAIN_NOT_FOUND);

  // Unknown ids on completion paths are silently ignored.
  EXPECT_EQ(causeway_complete_event(tracker, 999, nullptr), CAUSEWAY_OK);
  EXPECT_EQ(causeway_end_chain(tracker, 999), CAUSEWAY_OK);

  causeway_performance_t perf{};
  EXPECT_EQ(causeway_get_performance(tracker, 999, &perf), CAUSEWAY_OK);
  EXPECT_EQ(perf.slowest_event_id, 0u);
}

TEST(CApi, CleanupEnforcesChainCap) {
  causeway_options_t opts{};
  opts.disable_cleanup_timer = 1;
  opts.max_chains_in_memory = 5;
  causeway_tracker_t *small = nullptr;
  ASSERT_EQ(causeway_tracker_create(&opts, &small), CAUSEWAY_OK);

  uint64_t id = 0;
  for (int i = 0; i < 6; ++i)
    ASSERT_EQ(causeway_start_chain(small, CAUSEWAY_EVENT_CUSTOM, "c", &id),
              CAUSEWAY_OK);

  size_t expired = 0, evicted = 0;
  ASSERT_EQ(causeway_cleanup(small, &expired, &evicted), CAUSEWAY_OK);
  EXPECT_EQ(expired + evicted, 1u);

  size_t count = 0;
  ASSERT_EQ(causeway_chain_count(small, &count), CAUSEWAY_OK);
  EXPECT_EQ(count, 5u);
  ASSERT_EQ(causeway_event_count(small, &count), CAUSEWAY_OK);
  EXPECT_EQ(count, 5u);

  EXPECT_EQ(causeway_tracker_destroy(small), CAUSEWAY_OK);
}

TEST_F(CApiTest, TimelineBufferTooSmall) {
  uint64_t chain = 0, ev = 0;
  ASSERT_EQ(causeway_start_chain(tracker, CAUSEWAY_EVENT_USER_ACTION, "root",
                                 &chain),
            CAUSEWAY_OK);
  for (int i = 0; i < 4; ++i)
    ASSERT_EQ(causeway_add_event(tracker, CAUSEWAY_EVENT_RENDER, "paint",
                                 chain, 0, &ev),
              CAUSEWAY_OK);

  std::vector<causeway_timeline_entry_t> rows(2);
  size_t count = 0;
  EXPECT_EQ(causeway_get_timeline(tracker, chain, rows.data(), rows.size(),
                                  &count),
            CAUSEWAY_ERR_BUFFER_TOO_SMALL);
  EXPECT_EQ(count, 5u);
  EXPECT_EQ(rows[0].parent_id, 0u);
  EXPECT_EQ(rows[0].depth, 0u);
  EXPECT_EQ(rows[1].depth, 1u);
  EXPECT_EQ(rows[1].type, static_cast<uint16_t>(CAUSEWAY_EVENT_RENDER));

  rows.resize(count);
  ASSERT_EQ(causeway_get_timeline(tracker, chain, rows.data(), rows.size(),
                                  &count),
            CAUSEWAY_OK);
  EXPECT_EQ(rows[4].event_id, ev);
  EXPECT_EQ(rows[4].depth, 4u);
  EXPECT_EQ(rows[4].has_duration, 0);

  EXPECT_EQ(causeway_get_timeline(tracker, 999, nullptr, 0, &count),
            CAUSEWAY_OK);
  EXPECT_EQ(count, 0u);
}
