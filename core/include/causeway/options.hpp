#pragma once

/**
 * @file options.hpp
 * @brief Tracker configuration and time source.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace causeway {

/// Time source in microseconds. Must be monotonic non-decreasing.
using Clock = std::function<uint64_t()>;

/// Microseconds on std::chrono::steady_clock.
uint64_t steady_now_micros();

struct TrackerOptions {
  /// Chains reaching this many events are ended automatically.
  size_t max_chain_length = 100;

  /// Chains older than this are expired by the cleanup sweep.
  std::chrono::milliseconds max_chain_duration{30000};

  /// Live chain cap enforced by the cleanup sweep (oldest start time first).
  size_t max_chains_in_memory = 50;

  /// Period of the background cleanup sweep.
  std::chrono::milliseconds cleanup_interval{60000};

  /// Start the background sweeper on construction.
  bool enable_cleanup_timer = true;

  // Advisory switches for integrations that auto-instrument call sites.
  // The tracker itself does not read them.
  bool auto_track_state_changes = true;
  bool auto_track_api_calls = true;
  bool auto_track_user_actions = true;

  /// Defaults to steady_now_micros when empty.
  Clock clock;

  /**
   * @brief Defaults overlaid with environment variables.
   *
   *   CAUSEWAY_MAX_CHAIN_LENGTH       max_chain_length
   *   CAUSEWAY_MAX_CHAIN_DURATION_MS  max_chain_duration
   *   CAUSEWAY_MAX_CHAINS             max_chains_in_memory
   *   CAUSEWAY_CLEANUP_INTERVAL_MS    cleanup_interval
   *   CAUSEWAY_CLEANUP_TIMER          enable_cleanup_timer ("0"/"false" off)
   *
   * Unparseable values are logged and the default is kept.
   */
  static TrackerOptions from_env();

  /// @throws std::invalid_argument on a zero length, cap or interval.
  void validate() const;
};

} // namespace causeway
