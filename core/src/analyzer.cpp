#include "causeway/analyzer.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace causeway {

// ===========================================================================
// Query Filter
// ===========================================================================

bool matches(const CausalityChain &chain, const ChainFilter &filter) {
  if (chain.events.empty())
    return false;

  if (filter.root_type && chain.root_cause().type != *filter.root_type)
    return false;

  if (filter.start_range) {
    uint64_t start = chain.metadata.start_time;
    if (start < filter.start_range->start || start > filter.start_range->end)
      return false;
  }

  if (filter.tags) {
    std::unordered_set<std::string> chain_tags(chain.metadata.tags.begin(),
                                               chain.metadata.tags.end());
    bool any = std::any_of(
        filter.tags->begin(), filter.tags->end(),
        [&chain_tags](const std::string &tag) { return chain_tags.count(tag); });
    if (!any)
      return false;
  }

  if (filter.has_error && chain.has_error() != *filter.has_error)
    return false;

  return true;
}

// ===========================================================================
// Timeline
// ===========================================================================

std::vector<TimelineEntry> build_timeline(const CausalityChain &chain) {
  std::vector<uint32_t> order(chain.events.size());
  std::iota(order.begin(), order.end(), 0u);

  std::stable_sort(order.begin(), order.end(), [&chain](uint32_t a, uint32_t b) {
    return chain.events[a].timing.start_time <
           chain.events[b].timing.start_time;
  });

  std::vector<TimelineEntry> timeline;
  timeline.reserve(order.size());
  for (uint32_t slot : order) {
    const CausalEvent &ev = chain.events[slot];
    TimelineEntry entry;
    entry.event = ev;
    entry.depth = ev.metadata.depth;
    entry.duration = ev.timing.duration;
    entry.children = chain.child_ids(ev);
    timeline.push_back(std::move(entry));
  }
  return timeline;
}

// ===========================================================================
// Performance Impact
// ===========================================================================

PerformanceImpact performance_impact(const CausalityChain &chain) {
  PerformanceImpact impact;
  impact.total_duration = chain.metadata.total_duration.value_or(0);

  const CausalEvent *slowest = nullptr;
  uint64_t duration_sum = 0;
  size_t completed = 0;

  for (const CausalEvent &ev : chain.events) {
    if (ev.has_error())
      ++impact.error_count;

    if (!ev.timing.duration)
      continue;

    uint64_t d = *ev.timing.duration;
    duration_sum += d;
    ++completed;

    // Strictly greater: the first of several equal maxima wins.
    if (!slowest || d > *slowest->timing.duration)
      slowest = &ev;
  }

  if (slowest)
    impact.slowest_event = *slowest;
  if (completed > 0)
    impact.average_event_duration =
        static_cast<double>(duration_sum) / static_cast<double>(completed);

  return impact;
}

// ===========================================================================
// Export
// ===========================================================================

ChainExport export_snapshot(const CausalityChain &chain) {
  ChainExport out;
  out.timeline = build_timeline(chain);
  out.performance = performance_impact(chain);
  out.chain = chain;
  return out;
}

} // namespace causeway
