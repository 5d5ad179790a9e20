#pragma once

/**
 * @file analyzer.hpp
 * @brief Read-only analysis over chain snapshots.
 *
 * Everything here takes a const CausalityChain and never touches the
 * tracker's store. CausalityTracker calls these under its shared lock; they
 * are equally usable on snapshots returned by get_chain() / get_chains().
 */

#include "causeway/schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace causeway {

// ===========================================================================
// Query Filter
// ===========================================================================

/// Inclusive range on chain start time (microseconds).
struct TimeRange {
  uint64_t start = 0;
  uint64_t end = UINT64_MAX;
};

/**
 * @brief Chain selection criteria. Unset fields match everything.
 *
 * `tags` matches when the chain shares at least one tag with the set.
 * `has_error` matches chains where any event does (true) or none does
 * (false) carry an error.
 */
struct ChainFilter {
  std::optional<CausalEventType> root_type;
  std::optional<TimeRange> start_range;
  std::optional<std::vector<std::string>> tags;
  std::optional<bool> has_error;
};

bool matches(const CausalityChain &chain, const ChainFilter &filter);

// ===========================================================================
// Timeline
// ===========================================================================

struct TimelineEntry {
  CausalEvent event;
  uint32_t depth = 0;
  std::optional<uint64_t> duration;
  std::vector<EventId> children;
};

/// Events sorted ascending by start time. Equal start times keep insertion
/// order.
std::vector<TimelineEntry> build_timeline(const CausalityChain &chain);

// ===========================================================================
// Performance Impact
// ===========================================================================

struct PerformanceImpact {
  /// Chain total duration, 0 while the chain is still open.
  uint64_t total_duration = 0;

  /// Longest completed event; ties go to the earliest in insertion order.
  std::optional<CausalEvent> slowest_event;

  size_t error_count = 0;

  /// Mean over completed events only; 0 when none has completed.
  double average_event_duration = 0.0;
};

PerformanceImpact performance_impact(const CausalityChain &chain);

// ===========================================================================
// Export
// ===========================================================================

/// Self-contained snapshot for hand-off to inspection tooling.
struct ChainExport {
  CausalityChain chain;
  std::vector<TimelineEntry> timeline;
  PerformanceImpact performance;
};

ChainExport export_snapshot(const CausalityChain &chain);

} // namespace causeway
