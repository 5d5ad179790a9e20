/**
 * @file causeway_c_api.cpp
 * @brief C API implementation: exception-safe FFI boundary.
 *
 * Every extern "C" function is wrapped in try/catch so no C++ exception
 * reaches the caller:
 *     ChainNotFound         → CAUSEWAY_ERR_CHAIN_NOT_FOUND
 *     EventNotFound         → CAUSEWAY_ERR_EVENT_NOT_FOUND
 *     std::invalid_argument → CAUSEWAY_ERR_INVALID_ARG
 *     std::bad_alloc        → CAUSEWAY_ERR_OUT_OF_MEMORY
 *     anything else         → CAUSEWAY_ERR_UNKNOWN
 */

#include "causeway/causeway_c_api.h"
#include "causeway/tracker.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

// ===========================================================================
// Internal: cast opaque pointers to C++ objects
// ===========================================================================

static causeway::CausalityTracker *to_tracker(causeway_tracker_t *handle) {
  return reinterpret_cast<causeway::CausalityTracker *>(handle);
}

static bool valid_type(uint16_t type) {
  return type < causeway::CAUSAL_EVENT_TYPE_COUNT;
}

extern "C" {

CAUSEWAY_API const char *causeway_version(void) { return "0.1.0"; }

// ===========================================================================
// Lifecycle
// ===========================================================================

CAUSEWAY_API causeway_error_t
causeway_tracker_create(const causeway_options_t *opts,
                        causeway_tracker_t **out_tracker) {
  if (!out_tracker)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    causeway::TrackerOptions cpp_opts;
    if (opts) {
      if (opts->max_chain_length)
        cpp_opts.max_chain_length = opts->max_chain_length;
      if (opts->max_chain_duration_ms)
        cpp_opts.max_chain_duration =
            std::chrono::milliseconds(opts->max_chain_duration_ms);
      if (opts->max_chains_in_memory)
        cpp_opts.max_chains_in_memory = opts->max_chains_in_memory;
      if (opts->cleanup_interval_ms)
        cpp_opts.cleanup_interval =
            std::chrono::milliseconds(opts->cleanup_interval_ms);
      cpp_opts.enable_cleanup_timer = (opts->disable_cleanup_timer == 0);
    }

    auto *tracker = new causeway::CausalityTracker(std::move(cpp_opts));
    *out_tracker = reinterpret_cast<causeway_tracker_t *>(tracker);
    return CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (const std::invalid_argument &) {
    return CAUSEWAY_ERR_INVALID_ARG;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_tracker_destroy(causeway_tracker_t *tracker) {
  if (!tracker)
    return CAUSEWAY_OK; // NULL is a no-op

  try {
    delete to_tracker(tracker);
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

// ===========================================================================
// Chains & Events
// ===========================================================================

CAUSEWAY_API causeway_error_t causeway_start_chain(causeway_tracker_t *tracker,
                                                   uint16_t type,
                                                   const char *description,
                                                   uint64_t *out_chain_id) {
  if (!tracker || !description || !out_chain_id)
    return CAUSEWAY_ERR_NULL_PTR;
  if (!valid_type(type))
    return CAUSEWAY_ERR_INVALID_ARG;

  try {
    *out_chain_id = to_tracker(tracker)->start_chain(
        static_cast<causeway::CausalEventType>(type), description);
    return CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t causeway_add_event(causeway_tracker_t *tracker,
                                                 uint16_t type,
                                                 const char *description,
                                                 uint64_t chain_id,
                                                 uint64_t parent_id,
                                                 uint64_t *out_event_id) {
  if (!tracker || !description || !out_event_id)
    return CAUSEWAY_ERR_NULL_PTR;
  if (!valid_type(type))
    return CAUSEWAY_ERR_INVALID_ARG;

  try {
    *out_event_id = to_tracker(tracker)->add_event(
        static_cast<causeway::CausalEventType>(type), description, {}, {},
        chain_id, parent_id);
    return CAUSEWAY_OK;
  } catch (const causeway::ChainNotFound &) {
    return CAUSEWAY_ERR_CHAIN_NOT_FOUND;
  } catch (const causeway::EventNotFound &) {
    return CAUSEWAY_ERR_EVENT_NOT_FOUND;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_complete_event(causeway_tracker_t *tracker, uint64_t event_id,
                        const char *error_message) {
  if (!tracker)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    if (error_message)
      to_tracker(tracker)->complete_event(
          event_id, causeway::EventError{error_message, "ffi"});
    else
      to_tracker(tracker)->complete_event(event_id);
    return CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t causeway_end_chain(causeway_tracker_t *tracker,
                                                 uint64_t chain_id) {
  if (!tracker)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    to_tracker(tracker)->end_chain(chain_id);
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_current_chain(causeway_tracker_t *tracker, uint64_t *out_chain_id) {
  if (!tracker || !out_chain_id)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    *out_chain_id = to_tracker(tracker)->current_chain_id();
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t causeway_cleanup(causeway_tracker_t *tracker,
                                               size_t *out_expired,
                                               size_t *out_evicted) {
  if (!tracker)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    causeway::CleanupStats stats = to_tracker(tracker)->cleanup();
    if (out_expired)
      *out_expired = stats.expired;
    if (out_evicted)
      *out_evicted = stats.evicted;
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

// ===========================================================================
// Introspection
// ===========================================================================

CAUSEWAY_API causeway_error_t
causeway_chain_count(causeway_tracker_t *tracker, size_t *out_count) {
  if (!tracker || !out_count)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    *out_count = to_tracker(tracker)->chain_count();
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_event_count(causeway_tracker_t *tracker, size_t *out_count) {
  if (!tracker || !out_count)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    *out_count = to_tracker(tracker)->event_count();
    return CAUSEWAY_OK;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_get_chain_summary(causeway_tracker_t *tracker, uint64_t chain_id,
                           causeway_chain_summary_t *out_summary) {
  if (!tracker || !out_summary)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    auto chain = to_tracker(tracker)->get_chain(chain_id);
    if (!chain)
      return CAUSEWAY_ERR_CHAIN_NOT_FOUND;

    causeway_chain_summary_t s{};
    s.chain_id = chain->id;
    s.root_event_id = chain->root_cause().id;
    s.start_time = chain->metadata.start_time;
    s.end_time = chain->metadata.end_time.value_or(0);
    s.total_duration = chain->metadata.total_duration.value_or(0);
    s.event_count = chain->metadata.event_count;
    s.max_depth = chain->metadata.max_depth;
    s.is_ended = chain->is_ended() ? 1 : 0;
    s.has_error = chain->has_error() ? 1 : 0;
    *out_summary = s;
    return CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t
causeway_get_performance(causeway_tracker_t *tracker, uint64_t chain_id,
                         causeway_performance_t *out_perf) {
  if (!tracker || !out_perf)
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    auto impact = to_tracker(tracker)->get_chain_performance_impact(chain_id);

    causeway_performance_t p{};
    p.total_duration = impact.total_duration;
    if (impact.slowest_event) {
      p.slowest_event_id = impact.slowest_event->id;
      p.slowest_duration = impact.slowest_event->timing.duration.value_or(0);
    }
    p.error_count = impact.error_count;
    p.average_event_duration = impact.average_event_duration;
    *out_perf = p;
    return CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

CAUSEWAY_API causeway_error_t causeway_get_timeline(
    causeway_tracker_t *tracker, uint64_t chain_id,
    causeway_timeline_entry_t *out_entries, size_t max_entries,
    size_t *out_count) {
  if (!tracker || !out_count || (!out_entries && max_entries > 0))
    return CAUSEWAY_ERR_NULL_PTR;

  try {
    // One snapshot serves both the timeline and the parent lookups.
    auto chain = to_tracker(tracker)->get_chain(chain_id);
    if (!chain) {
      *out_count = 0;
      return CAUSEWAY_OK;
    }
    auto timeline = causeway::build_timeline(*chain);

    size_t count = std::min(timeline.size(), max_entries);
    for (size_t i = 0; i < count; ++i) {
      const auto &entry = timeline[i];
      causeway_timeline_entry_t row{};
      row.event_id = entry.event.id;
      row.parent_id = chain->parent_id(entry.event);
      row.start_time = entry.event.timing.start_time;
      row.duration = entry.duration.value_or(0);
      row.depth = entry.depth;
      row.child_count = static_cast<uint32_t>(entry.children.size());
      row.type = static_cast<uint16_t>(entry.event.type);
      row.severity = static_cast<uint8_t>(entry.event.metadata.severity);
      row.has_duration = entry.duration ? 1 : 0;
      row.has_error = entry.event.has_error() ? 1 : 0;
      out_entries[i] = row;
    }

    *out_count = timeline.size();
    return timeline.size() > max_entries ? CAUSEWAY_ERR_BUFFER_TOO_SMALL
                                         : CAUSEWAY_OK;
  } catch (const std::bad_alloc &) {
    return CAUSEWAY_ERR_OUT_OF_MEMORY;
  } catch (...) {
    return CAUSEWAY_ERR_UNKNOWN;
  }
}

} // extern "C"
