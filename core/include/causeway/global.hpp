#pragma once

/**
 * @file global.hpp
 * @brief Process-wide tracker and free-function API.
 *
 * The global tracker is built lazily from TrackerOptions::from_env() on
 * first use and destroyed by an atexit hook. The free functions never throw:
 * a tracking failure is logged and reported as INVALID_ID so the tracked
 * operation carries on.
 */

#include "causeway/schema.hpp"
#include "causeway/tracker.hpp"

#include <exception>
#include <future>
#include <string>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

namespace causeway {

/// The process-wide tracker.
CausalityTracker &global_tracker();

/// Stop the global tracker's sweeper and clear it. Registered with atexit on
/// first use; safe to call more than once.
void shutdown_global_tracker();

ChainId start_causal_chain(CausalEventType type, std::string description,
                           EventContext context = {},
                           EventAttributes attrs = {}) noexcept;

/// Extends the global active chain, starting one if none is active.
EventId add_causal_event(CausalEventType type, std::string description,
                         EventContext context = {},
                         EventAttributes attrs = {}) noexcept;

void complete_causal_event(EventId event_id) noexcept;
void complete_causal_event(EventId event_id, EventError error) noexcept;

/// End the global active chain, if any.
void end_current_chain() noexcept;

/// get_causality_context() of the global tracker; empty on failure.
LogFields get_causality_log_context() noexcept;

/// EventError from a caught exception; `kind` names the nearest standard
/// exception class (e.g. "runtime_error").
EventError to_event_error(const std::exception &e);

namespace detail {

template <typename T> struct is_future : std::false_type {};
template <typename T> struct is_future<std::future<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_future_v = is_future<std::decay_t<T>>::value;

/// Future that resolves with `inner` after completing `event_id` on
/// `tracker`, recording the error if `inner` throws.
template <typename T>
std::future<T> complete_when_ready(CausalityTracker &tracker, EventId event_id,
                                   std::future<T> inner) {
  return std::async(
      std::launch::async,
      [&tracker, event_id, inner = std::move(inner)]() mutable -> T {
        try {
          if constexpr (std::is_void_v<T>) {
            inner.get();
            tracker.complete_event(event_id);
          } else {
            T result = inner.get();
            tracker.complete_event(event_id);
            return result;
          }
        } catch (const std::exception &e) {
          tracker.complete_event(event_id, to_event_error(e));
          throw;
        } catch (...) {
          tracker.complete_event(event_id,
                                 EventError{"unknown exception", "unknown"});
          throw;
        }
      });
}

} // namespace detail

/**
 * @brief Wrap `fn` so each call is recorded as an event.
 *
 * Every invocation adds an event to the tracker's active chain, runs `fn`
 * with the same arguments, then completes the event. If `fn` throws, the
 * event is completed with the error and the exception is rethrown unchanged.
 * If recording the event itself fails, `fn` still runs untracked.
 *
 * When `fn` returns a std::future, the event stays open until that future
 * resolves: the wrapper returns a future of the same type that completes the
 * event with the result, or with the error and rethrows from get().
 *
 * `tracker` must outlive the returned callable and any future it returns.
 */
template <typename Fn>
auto with_causality(CausalityTracker &tracker, Fn fn, CausalEventType type,
                    std::string description, EventContext context = {}) {
  return [&tracker, fn = std::move(fn), type,
          description = std::move(description),
          context = std::move(context)](auto &&...args) mutable -> decltype(auto) {
    using Result = std::invoke_result_t<Fn &, decltype(args)...>;

    EventId event_id = INVALID_ID;
    try {
      event_id = tracker.add_event(type, description, context);
    } catch (const std::exception &e) {
      spdlog::warn("causeway: untracked call to '{}': {}", description,
                   e.what());
    }

    try {
      if constexpr (std::is_void_v<Result>) {
        fn(std::forward<decltype(args)>(args)...);
        tracker.complete_event(event_id);
      } else if constexpr (detail::is_future_v<Result>) {
        auto pending = fn(std::forward<decltype(args)>(args)...);
        return detail::complete_when_ready(tracker, event_id,
                                           std::move(pending));
      } else {
        decltype(auto) result = fn(std::forward<decltype(args)>(args)...);
        tracker.complete_event(event_id);
        return result;
      }
    } catch (const std::exception &e) {
      tracker.complete_event(event_id, to_event_error(e));
      throw;
    } catch (...) {
      tracker.complete_event(event_id, EventError{"unknown exception", "unknown"});
      throw;
    }
  };
}

/// with_causality() bound to the global tracker.
template <typename Fn>
auto with_causality(Fn fn, CausalEventType type, std::string description,
                    EventContext context = {}) {
  return with_causality(global_tracker(), std::move(fn), type,
                        std::move(description), std::move(context));
}

} // namespace causeway
