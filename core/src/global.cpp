#include "causeway/global.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <future>
#include <mutex>
#include <new>
#include <stdexcept>
#include <system_error>

namespace causeway {

namespace {

std::atomic<bool> g_tracker_created{false};

} // namespace

CausalityTracker &global_tracker() {
  static CausalityTracker tracker(TrackerOptions::from_env());
  static std::once_flag hook_installed;
  std::call_once(hook_installed, []() {
    g_tracker_created.store(true, std::memory_order_release);
    // Registered after the static above, so it runs before its destructor.
    if (std::atexit(shutdown_global_tracker) != 0)
      spdlog::warn("causeway: could not register exit hook");
  });
  return tracker;
}

void shutdown_global_tracker() {
  if (!g_tracker_created.load(std::memory_order_acquire))
    return;
  global_tracker().destroy();
}

// ===========================================================================
// Free-function API: tracking failures are logged, never propagated
// ===========================================================================

ChainId start_causal_chain(CausalEventType type, std::string description,
                           EventContext context,
                           EventAttributes attrs) noexcept {
  try {
    return global_tracker().start_chain(type, std::move(description),
                                        std::move(context), std::move(attrs));
  } catch (const std::exception &e) {
    spdlog::warn("causeway: start_causal_chain failed: {}", e.what());
    return INVALID_ID;
  }
}

EventId add_causal_event(CausalEventType type, std::string description,
                         EventContext context, EventAttributes attrs) noexcept {
  try {
    return global_tracker().add_event(type, std::move(description),
                                      std::move(context), std::move(attrs));
  } catch (const std::exception &e) {
    spdlog::warn("causeway: add_causal_event failed: {}", e.what());
    return INVALID_ID;
  }
}

void complete_causal_event(EventId event_id) noexcept {
  try {
    global_tracker().complete_event(event_id);
  } catch (const std::exception &e) {
    spdlog::warn("causeway: complete_causal_event({}) failed: {}", event_id,
                 e.what());
  }
}

void complete_causal_event(EventId event_id, EventError error) noexcept {
  try {
    global_tracker().complete_event(event_id, std::move(error));
  } catch (const std::exception &e) {
    spdlog::warn("causeway: complete_causal_event({}) failed: {}", event_id,
                 e.what());
  }
}

void end_current_chain() noexcept {
  try {
    CausalityTracker &tracker = global_tracker();
    ChainId current = tracker.current_chain_id();
    if (current != INVALID_ID)
      tracker.end_chain(current);
  } catch (const std::exception &e) {
    spdlog::warn("causeway: end_current_chain failed: {}", e.what());
  }
}

LogFields get_causality_log_context() noexcept {
  try {
    return global_tracker().get_causality_context();
  } catch (const std::exception &e) {
    spdlog::warn("causeway: get_causality_log_context failed: {}", e.what());
    return {};
  }
}

namespace {

/// Nearest standard exception class, most derived first.
const char *exception_kind(const std::exception &e) {
  if (dynamic_cast<const std::system_error *>(&e))
    return "system_error";
  if (dynamic_cast<const std::invalid_argument *>(&e))
    return "invalid_argument";
  if (dynamic_cast<const std::out_of_range *>(&e))
    return "out_of_range";
  if (dynamic_cast<const std::length_error *>(&e))
    return "length_error";
  if (dynamic_cast<const std::domain_error *>(&e))
    return "domain_error";
  if (dynamic_cast<const std::future_error *>(&e))
    return "future_error";
  if (dynamic_cast<const std::logic_error *>(&e))
    return "logic_error";
  if (dynamic_cast<const std::range_error *>(&e))
    return "range_error";
  if (dynamic_cast<const std::overflow_error *>(&e))
    return "overflow_error";
  if (dynamic_cast<const std::underflow_error *>(&e))
    return "underflow_error";
  if (dynamic_cast<const std::runtime_error *>(&e))
    return "runtime_error";
  if (dynamic_cast<const std::bad_alloc *>(&e))
    return "bad_alloc";
  return "exception";
}

} // namespace

EventError to_event_error(const std::exception &e) {
  return EventError{e.what(), exception_kind(e)};
}

} // namespace causeway
