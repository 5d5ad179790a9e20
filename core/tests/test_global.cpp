#include "causeway/global.hpp"
#include <exception>
#include <future>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace causeway;

namespace {

TrackerOptions quiet_options() {
  TrackerOptions opts;
  opts.enable_cleanup_timer = false;
  return opts;
}

} // namespace

// ============================================================================
// Free-function API on the process-wide tracker
// ============================================================================

class GlobalApiTest : public ::testing::Test {
protected:
  void SetUp() override { global_tracker().clear(); }
  void TearDown() override { global_tracker().clear(); }
};

TEST_F(GlobalApiTest, FreeFunctionsDriveTheGlobalTracker) {
  ChainId c = start_causal_chain(CausalEventType::UserAction, "click");
  ASSERT_NE(c, INVALID_ID);
  EventId ev = add_causal_event(CausalEventType::ApiCall, "GET /a");
  complete_causal_event(ev, EventError{"404", "http"});

  LogFields ctx = get_causality_log_context();
  EXPECT_EQ(ctx.at("causalityChainId"), std::to_string(c));
  EXPECT_EQ(ctx.at("causalityEventId"), std::to_string(ev));

  end_current_chain();
  EXPECT_EQ(global_tracker().current_chain_id(), INVALID_ID);
  EXPECT_TRUE(get_causality_log_context().empty());

  auto chain = global_tracker().get_chain(c);
  ASSERT_TRUE(chain.has_value());
  EXPECT_TRUE(chain->is_ended());
  EXPECT_TRUE(chain->has_error());
}

TEST_F(GlobalApiTest, EndCurrentChainWithoutChainIsNoOp) {
  end_current_chain();
  complete_causal_event(424242);
  EXPECT_EQ(global_tracker().chain_count(), 0u);
}

// ============================================================================
// with_causality
// ============================================================================

TEST(WithCausality, RecordsSuccessfulCall) {
  CausalityTracker tracker(quiet_options());
  ChainId c = tracker.start_chain(CausalEventType::UserAction, "click");

  auto add = with_causality(
      tracker, [](int a, int b) { return a + b; }, CausalEventType::Custom,
      "add");
  EXPECT_EQ(add(2, 3), 5);

  auto chain = tracker.get_chain(c);
  ASSERT_EQ(chain->events.size(), 2u);
  const CausalEvent &ev = chain->events[1];
  EXPECT_EQ(ev.description, "add");
  EXPECT_TRUE(ev.timing.duration.has_value());
  EXPECT_FALSE(ev.has_error());
}

TEST(WithCausality, RecordsFailureAndRethrows) {
  CausalityTracker tracker(quiet_options());
  ChainId c = tracker.start_chain(CausalEventType::UserAction, "click");

  auto fetch = with_causality(
      tracker,
      []() -> std::string { throw std::runtime_error("connection reset"); },
      CausalEventType::ApiCall, "fetch");
  EXPECT_THROW(fetch(), std::runtime_error);

  auto chain = tracker.get_chain(c);
  ASSERT_EQ(chain->events.size(), 2u);
  const CausalEvent &ev = chain->events[1];
  ASSERT_TRUE(ev.has_error());
  EXPECT_EQ(ev.metadata.error->message, "connection reset");
  EXPECT_EQ(ev.metadata.severity, Severity::High);
  EXPECT_TRUE(ev.timing.duration.has_value());
}

TEST(WithCausality, VoidCallableAndNoActiveChain) {
  CausalityTracker tracker(quiet_options());
  int calls = 0;
  auto bump = with_causality(
      tracker, [&calls]() { ++calls; }, CausalEventType::StateChange, "bump");

  bump();
  bump();
  EXPECT_EQ(calls, 2);

  // First call bootstrapped a chain, the second extended it.
  auto chains = tracker.get_chains();
  ASSERT_EQ(chains.size(), 1u);
  EXPECT_EQ(chains[0].events.size(), 2u);
  EXPECT_EQ(chains[0].events[1].metadata.depth, 1u);
}

TEST(WithCausality, FutureKeepsEventOpenUntilFailure) {
  CausalityTracker tracker(quiet_options());
  ChainId c = tracker.start_chain(CausalEventType::UserAction, "click");
  std::promise<std::string> reply;

  auto fetch = with_causality(
      tracker, [&reply]() { return reply.get_future(); },
      CausalEventType::ApiCall, "fetch");
  std::future<std::string> pending = fetch();

  auto chain = tracker.get_chain(c);
  ASSERT_EQ(chain->events.size(), 2u);
  EventId ev_id = chain->events[1].id;
  EXPECT_FALSE(chain->events[1].timing.duration.has_value());
  EXPECT_FALSE(chain->events[1].has_error());

  reply.set_exception(std::make_exception_ptr(std::runtime_error("timeout")));
  EXPECT_THROW(pending.get(), std::runtime_error);

  const CausalEvent ev = *tracker.get_chain(c)->find(ev_id);
  EXPECT_TRUE(ev.timing.duration.has_value());
  ASSERT_TRUE(ev.has_error());
  EXPECT_EQ(ev.metadata.error->message, "timeout");
  EXPECT_EQ(ev.metadata.error->kind, "runtime_error");
  EXPECT_EQ(ev.metadata.severity, Severity::High);
}

TEST(WithCausality, FutureCompletesEventWhenResolved) {
  CausalityTracker tracker(quiet_options());
  ChainId c = tracker.start_chain(CausalEventType::UserAction, "click");
  std::promise<int> reply;

  auto fetch = with_causality(
      tracker, [&reply](int) { return reply.get_future(); },
      CausalEventType::ApiCall, "count");
  std::future<int> pending = fetch(7);
  EventId ev_id = tracker.get_chain(c)->events[1].id;
  EXPECT_FALSE(
      tracker.get_chain(c)->find(ev_id)->timing.duration.has_value());

  reply.set_value(42);
  EXPECT_EQ(pending.get(), 42);

  const CausalEvent ev = *tracker.get_chain(c)->find(ev_id);
  EXPECT_TRUE(ev.timing.duration.has_value());
  EXPECT_FALSE(ev.has_error());
}

TEST(WithCausality, ToEventErrorNamesStandardKind) {
  struct CustomFailure : std::exception {
    const char *what() const noexcept override { return "custom"; }
  };

  EventError err = to_event_error(std::invalid_argument("bad input"));
  EXPECT_EQ(err.message, "bad input");
  EXPECT_EQ(err.kind, "invalid_argument");

  EXPECT_EQ(to_event_error(std::runtime_error("x")).kind, "runtime_error");
  EXPECT_EQ(to_event_error(std::out_of_range("x")).kind, "out_of_range");
  EXPECT_EQ(to_event_error(CustomFailure{}).kind, "exception");
  EXPECT_EQ(to_event_error(CustomFailure{}).message, "custom");
}
