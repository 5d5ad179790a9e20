#pragma once

/**
 * @file schema.hpp
 * @brief Causal event and chain records.
 *
 * A chain is an arena: it owns a growable vector of CausalEvent and every
 * causal link inside it (parent, children) is a slot index into that vector.
 * Event and chain IDs are monotonically increasing and never reused; 0 is
 * the "none" sentinel for both.
 *
 *   chain.events[0]            root cause, depth 0, no parent
 *   chain.events[i].parent     slot of the event that caused events[i]
 *   chain.events[i].children   slots of the events caused by events[i]
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace causeway {

/// Unique chain identifier (0 = none).
using ChainId = uint64_t;

/// Unique event identifier (0 = none).
using EventId = uint64_t;

/// Sentinel for "no chain" / "no event".
inline constexpr uint64_t INVALID_ID = 0;

// ===========================================================================
// Enumerations
// ===========================================================================

/// Event classes. Values are stable: the C API exposes them as integers.
enum class CausalEventType : uint16_t {
  UserAction = 0,
  ApiCall = 1,
  StateChange = 2,
  Render = 3,
  AsyncOperation = 4,
  SystemEvent = 5,
  Error = 6,
  Performance = 7,
  Navigation = 8,
  Websocket = 9,
  Custom = 10,
};

/// Number of CausalEventType values.
inline constexpr uint16_t CAUSAL_EVENT_TYPE_COUNT = 11;

enum class Severity : uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
};

/// Wire name of an event type ("user_action", "api_call", ...).
std::string_view to_string(CausalEventType type) noexcept;

/// Wire name of a severity ("low", "medium", "high").
std::string_view to_string(Severity severity) noexcept;

/// Parse a wire name. Returns nullopt for unknown names.
std::optional<CausalEventType> parse_event_type(std::string_view name) noexcept;

// ===========================================================================
// Event Record
// ===========================================================================

/// Timestamps are microseconds from the tracker's clock.
struct EventTiming {
  uint64_t start_time = 0;
  std::optional<uint64_t> end_time;
  std::optional<uint64_t> duration; // set only on completion
};

/**
 * @brief Where an event happened.
 *
 * The four well-known keys have their own fields; anything else goes into
 * `fields`.
 */
struct EventContext {
  std::optional<std::string> component;
  std::optional<std::string> window_id;
  std::optional<std::string> app_id;
  std::optional<std::string> user_id;
  std::map<std::string, std::string> fields;
};

/// Failure recorded against an event by complete_event().
struct EventError {
  std::string message;
  std::string kind; // exception class or caller-chosen category
};

/**
 * @brief Caller-supplied metadata for start_chain() / add_event().
 *
 * Depth is never caller-supplied; the tracker computes it from the parent.
 */
struct EventAttributes {
  Severity severity = Severity::Medium;
  std::vector<std::string> tags;
  std::optional<std::string> data;
};

struct EventMetadata {
  uint32_t depth = 0;
  Severity severity = Severity::Medium;
  std::vector<std::string> tags;
  std::optional<EventError> error;
  std::optional<std::string> data;
};

struct CausalEvent {
  EventId id = INVALID_ID;
  ChainId chain_id = INVALID_ID;

  /// Slot of the parent inside the owning chain (nullopt for the root).
  std::optional<uint32_t> parent;

  /// Slots of the children inside the owning chain, in creation order.
  std::vector<uint32_t> children;

  CausalEventType type = CausalEventType::Custom;
  std::string description;
  EventTiming timing;
  EventContext context;
  EventMetadata metadata;

  bool is_root() const noexcept { return !parent.has_value(); }
  bool has_error() const noexcept { return metadata.error.has_value(); }
};

// ===========================================================================
// Chain Record
// ===========================================================================

struct ChainMetadata {
  uint64_t start_time = 0;
  std::optional<uint64_t> end_time;
  std::optional<uint64_t> total_duration;
  size_t event_count = 0;
  uint32_t max_depth = 0;
  std::vector<std::string> tags;
};

/**
 * @brief A causality chain and the arena of events it owns.
 *
 * INVARIANTS (maintained by CausalityTracker):
 *   - events is non-empty and events[0] is the root cause
 *   - metadata.event_count == events.size()
 *   - metadata.max_depth == max(events[i].metadata.depth)
 */
struct CausalityChain {
  ChainId id = INVALID_ID;
  std::vector<CausalEvent> events;
  ChainMetadata metadata;

  const CausalEvent &root_cause() const { return events.front(); }

  /// Event by ID, or nullptr if it is not part of this chain.
  const CausalEvent *find(EventId event_id) const noexcept;

  /// Parent event ID of `event`, or INVALID_ID for the root.
  EventId parent_id(const CausalEvent &event) const noexcept;

  /// Child event IDs of `event`, in creation order.
  std::vector<EventId> child_ids(const CausalEvent &event) const;

  bool is_ended() const noexcept { return metadata.end_time.has_value(); }

  /// True if any event in the chain carries an error.
  bool has_error() const noexcept;
};

} // namespace causeway
