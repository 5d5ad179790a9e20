#pragma once

/**
 * @file tracker.hpp
 * @brief Causality Chain Tracker: bounded in-memory forest of event graphs.
 *
 * Store layout:
 *   chains_       ChainId → CausalityChain (the chain owns its event arena)
 *   event_index_  EventId → (ChainId, slot) for O(1) completion lookups
 *   active_chain_ implicit target for add_event() calls without a chain id
 *
 * Memory is bounded two ways, both enforced by cleanup():
 *   1. Age:  chains with now - start_time > max_chain_duration are dropped
 *   2. Cap:  while more than max_chains_in_memory remain, the chain with the
 *            oldest start_time is dropped (creation order, NOT activity)
 *
 * cleanup() runs on a background Sweeper every cleanup_interval and
 * opportunistically from start_chain() once the store passes 1.2× the cap.
 */

#include "causeway/analyzer.hpp"
#include "causeway/options.hpp"
#include "causeway/schema.hpp"
#include "causeway/sweeper.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace causeway {

/// Flat key → value record for merging into structured log lines.
using LogFields = std::map<std::string, std::string>;

/// Explicit chain id that is not in the store.
class ChainNotFound : public std::invalid_argument {
public:
  explicit ChainNotFound(ChainId chain_id)
      : std::invalid_argument("Chain " + std::to_string(chain_id) +
                              " not found"),
        chain_id(chain_id) {}

  ChainId chain_id;
};

/// Explicit parent id that is not an event of the target chain.
class EventNotFound : public std::invalid_argument {
public:
  EventNotFound(EventId event_id, ChainId chain_id)
      : std::invalid_argument("Parent event " + std::to_string(event_id) +
                              " not found in chain " +
                              std::to_string(chain_id)),
        event_id(event_id) {}

  EventId event_id;
};

/// Result of a single cleanup() pass.
struct CleanupStats {
  size_t expired = 0; // removed for age
  size_t evicted = 0; // removed for the memory cap
};

/**
 * @brief Records cause-and-effect chains of events.
 *
 * Concurrency:
 *   - Mutations (start/add/complete/end/cleanup/clear) take unique_lock on
 *     rw_mutex_ and run to completion
 *   - Queries take shared_lock and return copies, never references into the
 *     store, so results stay valid across a concurrent sweep
 *   - Nothing logs while rw_mutex_ is held; a logger formatted with the
 *     causality flag reads the tracker back
 *
 * The implicit active chain is one shared slot. Unrelated flows that omit
 * the chain id during the same tick are attributed to whichever chain is
 * active; use ChainScope (or pass ids) to keep them apart.
 */
class CausalityTracker {
public:
  /// @throws std::invalid_argument if options fail validate().
  explicit CausalityTracker(TrackerOptions options = {});

  ~CausalityTracker();

  // Non-copyable, non-movable (the sweeper captures `this`)
  CausalityTracker(const CausalityTracker &) = delete;
  CausalityTracker &operator=(const CausalityTracker &) = delete;

  // -----------------------------------------------------------------------
  // Chain Lifecycle
  // -----------------------------------------------------------------------

  /**
   * @brief Start a new chain with a root event at depth 0.
   *
   * The new chain becomes the active chain. Chain tags are taken from
   * attrs.tags.
   */
  ChainId start_chain(CausalEventType type, std::string description,
                      EventContext context = {}, EventAttributes attrs = {});

  /**
   * @brief Append an event to a chain.
   *
   * Target chain: `chain_id` if non-zero, else the active chain. With
   * neither, behaves like start_chain() and returns the new root event's id.
   *
   * Parent: `parent_event_id` if non-zero, else the chain's most recently
   * appended event. Depth is parent depth + 1.
   *
   * A chain that reaches max_chain_length events is ended on the spot.
   *
   * @throws ChainNotFound if `chain_id` is non-zero and unknown.
   * @throws EventNotFound if `parent_event_id` is non-zero and not an event
   *         of the target chain.
   */
  EventId add_event(CausalEventType type, std::string description,
                    EventContext context = {}, EventAttributes attrs = {},
                    ChainId chain_id = INVALID_ID,
                    EventId parent_event_id = INVALID_ID);

  /// Stamp end time and duration. Unknown ids are ignored.
  void complete_event(EventId event_id);

  /// As complete_event(id), and record `error` with severity raised to High.
  void complete_event(EventId event_id, EventError error);

  /// Stamp end time and total duration; clears the active slot if it
  /// pointed here. Unknown ids are ignored.
  void end_chain(ChainId chain_id);

  /// Active chain id, or INVALID_ID.
  ChainId current_chain_id() const;

  // -----------------------------------------------------------------------
  // Queries (read-only, return snapshots)
  // -----------------------------------------------------------------------

  std::optional<CausalityChain> get_chain(ChainId chain_id) const;

  /// Chains matching `filter`, in creation order. The default filter
  /// matches every chain.
  std::vector<CausalityChain> get_chains(const ChainFilter &filter = {}) const;

  /// Empty for an unknown chain.
  std::vector<TimelineEntry> get_chain_timeline(ChainId chain_id) const;

  /// All-zero result for an unknown chain.
  PerformanceImpact get_chain_performance_impact(ChainId chain_id) const;

  /// nullopt for an unknown chain.
  std::optional<ChainExport> export_chain(ChainId chain_id) const;

  /**
   * @brief Flattened context of the active chain's latest event.
   *
   * Keys: causalityChainId, causalityEventId, causalityDepth,
   * causalityRootCause, causalityEventCount, causalityChainDuration (µs).
   * Empty when no chain is active.
   */
  LogFields get_causality_context() const;

  size_t chain_count() const;
  size_t event_count() const;

  // -----------------------------------------------------------------------
  // Cleanup & Shutdown
  // -----------------------------------------------------------------------

  /// Age-based expiry, then memory-cap eviction.
  CleanupStats cleanup();

  /// Drop every chain and event and clear the active slot.
  void clear();

  /// Stop the sweeper and clear all state. Idempotent.
  void destroy();

  bool sweeper_running() const;

  const TrackerOptions &options() const noexcept { return options_; }

private:
  struct EventLocation {
    ChainId chain;
    uint32_t slot;
  };

  TrackerOptions options_;

  // -----------------------------------------------------------------------
  // Store (protected by rw_mutex_)
  // -----------------------------------------------------------------------

  /// Ordered by id, which is creation order.
  std::map<ChainId, CausalityChain> chains_;
  std::unordered_map<EventId, EventLocation> event_index_;
  ChainId active_chain_ = INVALID_ID;

  ChainId next_chain_id_ = 1;
  EventId next_event_id_ = 1;

  mutable std::shared_mutex rw_mutex_;

  // -----------------------------------------------------------------------
  // Background Sweeper (protected by sweeper_mutex_)
  // -----------------------------------------------------------------------

  /// Lock ordering: sweeper_mutex_ is never held while joining the worker,
  /// and never taken under rw_mutex_.
  mutable std::mutex sweeper_mutex_;
  std::unique_ptr<Sweeper> sweeper_;

  // -----------------------------------------------------------------------
  // Internal Helpers (caller holds unique_lock on rw_mutex_)
  // -----------------------------------------------------------------------

  uint64_t now() const { return options_.clock(); }

  ChainId start_chain_locked(CausalEventType type, std::string description,
                             EventContext context, EventAttributes attrs,
                             uint64_t now, CleanupStats &stats);

  void end_chain_locked(CausalityChain &chain, uint64_t now);

  void complete_event_locked(EventId event_id, std::optional<EventError> error);

  CleanupStats cleanup_locked(uint64_t now);

  /// Remove a chain and all its events from both maps.
  void erase_chain_locked(std::map<ChainId, CausalityChain>::iterator it);

  /// Log the outcome of a cleanup pass. Call without rw_mutex_ held.
  static void log_cleanup(const CleanupStats &stats, const char *trigger);
};

/**
 * @brief Explicit chain handle.
 *
 * Starts a chain on construction and pins every add_event() to it, so
 * concurrent flows never borrow each other's active slot. Ends the chain
 * when destroyed or on end().
 */
class ChainScope {
public:
  ChainScope(CausalityTracker &tracker, CausalEventType type,
             std::string description, EventContext context = {},
             EventAttributes attrs = {});
  ~ChainScope();

  ChainScope(const ChainScope &) = delete;
  ChainScope &operator=(const ChainScope &) = delete;
  ChainScope(ChainScope &&other) noexcept;
  ChainScope &operator=(ChainScope &&) = delete;

  ChainId id() const noexcept { return chain_id_; }

  /// @throws ChainNotFound if the chain has been evicted.
  /// @throws std::logic_error after end() or on a moved-from scope.
  EventId add_event(CausalEventType type, std::string description,
                    EventContext context = {}, EventAttributes attrs = {},
                    EventId parent_event_id = INVALID_ID);

  /// End the chain now. Later calls are no-ops.
  void end();

private:
  CausalityTracker *tracker_;
  ChainId chain_id_;
};

} // namespace causeway
