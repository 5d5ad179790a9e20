/**
 * @file tracker.cpp
 * @brief Causality Chain Tracker implementation.
 *
 * Every public mutation follows the same shape:
 *   1. unique_lock(rw_mutex_), read the clock once
 *   2. mutate chains_ / event_index_ / active_chain_ via *_locked helpers
 *   3. release the lock, then log
 */

#include "causeway/tracker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace causeway {

namespace {

uint64_t elapsed(uint64_t from, uint64_t to) noexcept {
  return to >= from ? to - from : 0;
}

} // namespace

// ===========================================================================
// Construction / Destruction
// ===========================================================================

CausalityTracker::CausalityTracker(TrackerOptions options)
    : options_(std::move(options)) {
  options_.validate();
  if (!options_.clock)
    options_.clock = steady_now_micros;

  if (options_.enable_cleanup_timer) {
    sweeper_ = std::make_unique<Sweeper>(options_.cleanup_interval, [this]() {
      log_cleanup(cleanup(), "timer");
    });
  }

  spdlog::debug("causeway: tracker started (max_chains={}, max_length={}, "
                "max_duration={}ms, sweep={})",
                options_.max_chains_in_memory, options_.max_chain_length,
                options_.max_chain_duration.count(),
                options_.enable_cleanup_timer
                    ? std::to_string(options_.cleanup_interval.count()) + "ms"
                    : std::string("off"));
}

CausalityTracker::~CausalityTracker() { destroy(); }

// ===========================================================================
// Chain Lifecycle
// ===========================================================================

ChainId CausalityTracker::start_chain(CausalEventType type,
                                      std::string description,
                                      EventContext context,
                                      EventAttributes attrs) {
  CleanupStats stats;
  ChainId chain_id;
  {
    std::unique_lock lock(rw_mutex_);
    chain_id = start_chain_locked(type, std::move(description),
                                  std::move(context), std::move(attrs), now(),
                                  stats);
  }
  log_cleanup(stats, "capacity");
  return chain_id;
}

ChainId CausalityTracker::start_chain_locked(CausalEventType type,
                                             std::string description,
                                             EventContext context,
                                             EventAttributes attrs,
                                             uint64_t now,
                                             CleanupStats &stats) {
  ChainId chain_id = next_chain_id_++;
  EventId event_id = next_event_id_++;

  CausalEvent root;
  root.id = event_id;
  root.chain_id = chain_id;
  root.type = type;
  root.description = std::move(description);
  root.timing.start_time = now;
  root.context = std::move(context);
  root.metadata.depth = 0;
  root.metadata.severity = attrs.severity;
  root.metadata.tags = attrs.tags;
  root.metadata.data = std::move(attrs.data);

  CausalityChain chain;
  chain.id = chain_id;
  chain.metadata.start_time = now;
  chain.metadata.event_count = 1;
  chain.metadata.max_depth = 0;
  chain.metadata.tags = std::move(attrs.tags);
  chain.events.push_back(std::move(root));

  chains_.emplace(chain_id, std::move(chain));
  event_index_[event_id] = EventLocation{chain_id, 0};
  active_chain_ = chain_id;

  // Soft capacity: 1.2× the cap, compared in integers.
  if (chains_.size() * 5 > options_.max_chains_in_memory * 6)
    stats = cleanup_locked(now);

  return chain_id;
}

EventId CausalityTracker::add_event(CausalEventType type,
                                    std::string description,
                                    EventContext context, EventAttributes attrs,
                                    ChainId chain_id,
                                    EventId parent_event_id) {
  EventId event_id;
  ChainId auto_ended = INVALID_ID;
  CleanupStats stats;
  {
    std::unique_lock lock(rw_mutex_);
    uint64_t ts = now();

    ChainId target = chain_id != INVALID_ID ? chain_id : active_chain_;
    if (target == INVALID_ID) {
      // No chain to extend: bootstrap one so the event is never orphaned.
      ChainId fresh =
          start_chain_locked(type, std::move(description), std::move(context),
                             std::move(attrs), ts, stats);
      event_id = chains_.at(fresh).events.front().id;
    } else {
      auto it = chains_.find(target);
      if (it == chains_.end())
        throw ChainNotFound(target);
      CausalityChain &chain = it->second;

      uint32_t parent_slot;
      if (parent_event_id != INVALID_ID) {
        auto loc = event_index_.find(parent_event_id);
        if (loc == event_index_.end() || loc->second.chain != target)
          throw EventNotFound(parent_event_id, target);
        parent_slot = loc->second.slot;
      } else {
        parent_slot = static_cast<uint32_t>(chain.events.size() - 1);
      }

      event_id = next_event_id_++;
      auto slot = static_cast<uint32_t>(chain.events.size());

      CausalEvent ev;
      ev.id = event_id;
      ev.chain_id = target;
      ev.parent = parent_slot;
      ev.type = type;
      ev.description = std::move(description);
      ev.timing.start_time = ts;
      ev.context = std::move(context);
      ev.metadata.depth = chain.events[parent_slot].metadata.depth + 1;
      ev.metadata.severity = attrs.severity;
      ev.metadata.tags = std::move(attrs.tags);
      ev.metadata.data = std::move(attrs.data);

      uint32_t depth = ev.metadata.depth;
      chain.events.push_back(std::move(ev));
      chain.events[parent_slot].children.push_back(slot);

      chain.metadata.event_count = chain.events.size();
      chain.metadata.max_depth = std::max(chain.metadata.max_depth, depth);
      event_index_[event_id] = EventLocation{target, slot};

      // Runaway-loop guard.
      if (chain.events.size() >= options_.max_chain_length) {
        end_chain_locked(chain, ts);
        auto_ended = target;
      }
    }
  }

  log_cleanup(stats, "capacity");
  if (auto_ended != INVALID_ID)
    spdlog::debug("causeway: chain {} reached {} events, ended", auto_ended,
                  options_.max_chain_length);
  return event_id;
}

void CausalityTracker::complete_event(EventId event_id) {
  std::unique_lock lock(rw_mutex_);
  complete_event_locked(event_id, std::nullopt);
}

void CausalityTracker::complete_event(EventId event_id, EventError error) {
  std::unique_lock lock(rw_mutex_);
  complete_event_locked(event_id, std::move(error));
}

void CausalityTracker::complete_event_locked(EventId event_id,
                                             std::optional<EventError> error) {
  auto loc = event_index_.find(event_id);
  if (loc == event_index_.end())
    return; // evicted or never existed

  auto it = chains_.find(loc->second.chain);
  if (it == chains_.end() || loc->second.slot >= it->second.events.size())
    return;

  CausalEvent &ev = it->second.events[loc->second.slot];
  uint64_t ts = now();
  ev.timing.end_time = ts;
  ev.timing.duration = elapsed(ev.timing.start_time, ts);

  if (error) {
    ev.metadata.error = std::move(*error);
    ev.metadata.severity = Severity::High;
  }
}

void CausalityTracker::end_chain(ChainId chain_id) {
  std::unique_lock lock(rw_mutex_);
  auto it = chains_.find(chain_id);
  if (it == chains_.end())
    return;
  end_chain_locked(it->second, now());
}

void CausalityTracker::end_chain_locked(CausalityChain &chain, uint64_t now) {
  chain.metadata.end_time = now;
  chain.metadata.total_duration = elapsed(chain.metadata.start_time, now);
  if (active_chain_ == chain.id)
    active_chain_ = INVALID_ID;
}

ChainId CausalityTracker::current_chain_id() const {
  std::shared_lock lock(rw_mutex_);
  return active_chain_;
}

// ===========================================================================
// Queries
// ===========================================================================

std::optional<CausalityChain> CausalityTracker::get_chain(ChainId chain_id) const {
  std::shared_lock lock(rw_mutex_);
  auto it = chains_.find(chain_id);
  if (it == chains_.end())
    return std::nullopt;
  return it->second;
}

std::vector<CausalityChain>
CausalityTracker::get_chains(const ChainFilter &filter) const {
  std::shared_lock lock(rw_mutex_);
  std::vector<CausalityChain> result;
  for (const auto &[id, chain] : chains_) {
    if (matches(chain, filter))
      result.push_back(chain);
  }
  return result;
}

std::vector<TimelineEntry>
CausalityTracker::get_chain_timeline(ChainId chain_id) const {
  std::shared_lock lock(rw_mutex_);
  auto it = chains_.find(chain_id);
  if (it == chains_.end())
    return {};
  return build_timeline(it->second);
}

PerformanceImpact
CausalityTracker::get_chain_performance_impact(ChainId chain_id) const {
  std::shared_lock lock(rw_mutex_);
  auto it = chains_.find(chain_id);
  if (it == chains_.end())
    return {};
  return performance_impact(it->second);
}

std::optional<ChainExport> CausalityTracker::export_chain(ChainId chain_id) const {
  std::shared_lock lock(rw_mutex_);
  auto it = chains_.find(chain_id);
  if (it == chains_.end())
    return std::nullopt;
  return export_snapshot(it->second);
}

LogFields CausalityTracker::get_causality_context() const {
  std::shared_lock lock(rw_mutex_);
  if (active_chain_ == INVALID_ID)
    return {};

  auto it = chains_.find(active_chain_);
  if (it == chains_.end() || it->second.events.empty())
    return {};

  const CausalityChain &chain = it->second;
  const CausalEvent &last = chain.events.back();

  return LogFields{
      {"causalityChainId", std::to_string(chain.id)},
      {"causalityEventId", std::to_string(last.id)},
      {"causalityDepth", std::to_string(last.metadata.depth)},
      {"causalityRootCause", chain.root_cause().description},
      {"causalityEventCount", std::to_string(chain.metadata.event_count)},
      {"causalityChainDuration",
       std::to_string(elapsed(chain.metadata.start_time, now()))},
  };
}

size_t CausalityTracker::chain_count() const {
  std::shared_lock lock(rw_mutex_);
  return chains_.size();
}

size_t CausalityTracker::event_count() const {
  std::shared_lock lock(rw_mutex_);
  return event_index_.size();
}

// ===========================================================================
// Cleanup & Eviction
// ===========================================================================

CleanupStats CausalityTracker::cleanup() {
  std::unique_lock lock(rw_mutex_);
  return cleanup_locked(now());
}

CleanupStats CausalityTracker::cleanup_locked(uint64_t now) {
  CleanupStats stats;

  // -----------------------------------------------------------------------
  // Pass 1: age-based expiry
  // -----------------------------------------------------------------------
  auto max_age = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          options_.max_chain_duration)
          .count());

  for (auto it = chains_.begin(); it != chains_.end();) {
    auto next = std::next(it);
    if (elapsed(it->second.metadata.start_time, now) > max_age) {
      erase_chain_locked(it);
      ++stats.expired;
    }
    it = next;
  }

  // -----------------------------------------------------------------------
  // Pass 2: memory cap, oldest start_time first
  // -----------------------------------------------------------------------
  if (chains_.size() > options_.max_chains_in_memory) {
    std::vector<std::pair<uint64_t, ChainId>> by_start;
    by_start.reserve(chains_.size());
    for (const auto &[id, chain] : chains_)
      by_start.emplace_back(chain.metadata.start_time, id);

    // Ties on start_time fall back to id, i.e. creation order.
    std::sort(by_start.begin(), by_start.end());

    size_t excess = chains_.size() - options_.max_chains_in_memory;
    for (size_t i = 0; i < excess; ++i) {
      auto it = chains_.find(by_start[i].second);
      if (it != chains_.end()) {
        erase_chain_locked(it);
        ++stats.evicted;
      }
    }
  }

  return stats;
}

void CausalityTracker::erase_chain_locked(
    std::map<ChainId, CausalityChain>::iterator it) {
  for (const CausalEvent &ev : it->second.events)
    event_index_.erase(ev.id);
  if (active_chain_ == it->first)
    active_chain_ = INVALID_ID;
  chains_.erase(it);
}

void CausalityTracker::log_cleanup(const CleanupStats &stats,
                                   const char *trigger) {
  if (stats.expired == 0 && stats.evicted == 0)
    return;
  spdlog::debug("causeway: {} sweep removed {} expired, {} over capacity",
                trigger, stats.expired, stats.evicted);
}

void CausalityTracker::clear() {
  std::unique_lock lock(rw_mutex_);
  chains_.clear();
  event_index_.clear();
  active_chain_ = INVALID_ID;
}

void CausalityTracker::destroy() {
  std::unique_ptr<Sweeper> sweeper;
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    sweeper = std::move(sweeper_);
  }
  // Join outside both locks: the worker may be mid-sweep on rw_mutex_.
  if (sweeper) {
    sweeper->stop();
    spdlog::debug("causeway: cleanup sweeper stopped after {} sweeps",
                  sweeper->ticks());
  }
  clear();
}

bool CausalityTracker::sweeper_running() const {
  std::lock_guard<std::mutex> lock(sweeper_mutex_);
  return sweeper_ && sweeper_->running();
}

// ===========================================================================
// ChainScope
// ===========================================================================

ChainScope::ChainScope(CausalityTracker &tracker, CausalEventType type,
                       std::string description, EventContext context,
                       EventAttributes attrs)
    : tracker_(&tracker),
      chain_id_(tracker.start_chain(type, std::move(description),
                                    std::move(context), std::move(attrs))) {}

ChainScope::ChainScope(ChainScope &&other) noexcept
    : tracker_(other.tracker_), chain_id_(other.chain_id_) {
  other.tracker_ = nullptr;
  other.chain_id_ = INVALID_ID;
}

ChainScope::~ChainScope() {
  try {
    end();
  } catch (const std::exception &e) {
    spdlog::warn("causeway: failed to end chain {}: {}", chain_id_, e.what());
  }
}

EventId ChainScope::add_event(CausalEventType type, std::string description,
                              EventContext context, EventAttributes attrs,
                              EventId parent_event_id) {
  if (!tracker_)
    throw std::logic_error(
        chain_id_ == INVALID_ID
            ? std::string("ChainScope has been moved from")
            : "ChainScope for chain " + std::to_string(chain_id_) +
                  " has ended");
  return tracker_->add_event(type, std::move(description), std::move(context),
                             std::move(attrs), chain_id_, parent_event_id);
}

void ChainScope::end() {
  if (!tracker_)
    return;
  tracker_->end_chain(chain_id_);
  tracker_ = nullptr;
}

} // namespace causeway
