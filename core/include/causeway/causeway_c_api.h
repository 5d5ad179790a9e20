/**
 * @file causeway_c_api.h
 * @brief Flat C API for the Causeway causality tracker.
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` for flat ABI compatibility.
 *   2. All functions return `causeway_error_t` (integer enum).
 *   3. C++ exceptions NEVER cross the FFI boundary.
 *   4. Caller-allocated buffers: the caller passes an array + capacity +
 *      out_count. Nothing is malloc'ed inside and returned across FFI.
 *   5. Opaque pointer pattern: `causeway_tracker_t` hides all C++ internals.
 *   6. Id 0 means "none" for chains, events and parents.
 */

#ifndef CAUSEWAY_C_API_H
#define CAUSEWAY_C_API_H

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(_WIN64)
#if defined(CAUSEWAY_STATIC)
#define CAUSEWAY_API
#elif defined(CAUSEWAY_BUILDING_SHARED)
#define CAUSEWAY_API __declspec(dllexport)
#else
#define CAUSEWAY_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define CAUSEWAY_API __attribute__((visibility("default")))
#else
#define CAUSEWAY_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  CAUSEWAY_OK = 0,                    /**< Success */
  CAUSEWAY_ERR_NULL_PTR = -1,         /**< A required pointer was NULL */
  CAUSEWAY_ERR_INVALID_ARG = -2,      /**< Bad option or enum value */
  CAUSEWAY_ERR_CHAIN_NOT_FOUND = -3,  /**< Explicit chain id is unknown */
  CAUSEWAY_ERR_EVENT_NOT_FOUND = -4,  /**< Explicit parent id is unknown */
  CAUSEWAY_ERR_OUT_OF_MEMORY = -5,    /**< Allocation failed */
  CAUSEWAY_ERR_BUFFER_TOO_SMALL = -6, /**< Caller buffer too small */
  CAUSEWAY_ERR_UNKNOWN = -99          /**< Unknown internal error */
} causeway_error_t;

/** Opaque tracker handle. */
typedef struct causeway_tracker_s causeway_tracker_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * VALUE TYPES
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** Event types; values match causeway::CausalEventType. */
typedef enum {
  CAUSEWAY_EVENT_USER_ACTION = 0,
  CAUSEWAY_EVENT_API_CALL = 1,
  CAUSEWAY_EVENT_STATE_CHANGE = 2,
  CAUSEWAY_EVENT_RENDER = 3,
  CAUSEWAY_EVENT_ASYNC_OPERATION = 4,
  CAUSEWAY_EVENT_SYSTEM_EVENT = 5,
  CAUSEWAY_EVENT_ERROR = 6,
  CAUSEWAY_EVENT_PERFORMANCE = 7,
  CAUSEWAY_EVENT_NAVIGATION = 8,
  CAUSEWAY_EVENT_WEBSOCKET = 9,
  CAUSEWAY_EVENT_CUSTOM = 10
} causeway_event_type_t;

/** Tracker options. Zero fields take the library default. */
typedef struct {
  uint32_t max_chain_length;      /**< default 100 */
  uint64_t max_chain_duration_ms; /**< default 30000 */
  uint32_t max_chains_in_memory;  /**< default 50 */
  uint64_t cleanup_interval_ms;   /**< default 60000 */
  int disable_cleanup_timer;      /**< non-zero = no background sweeper */
} causeway_options_t;

typedef struct {
  uint64_t chain_id;
  uint64_t root_event_id;
  uint64_t start_time;     /**< µs */
  uint64_t end_time;       /**< µs, valid if is_ended */
  uint64_t total_duration; /**< µs, valid if is_ended */
  uint64_t event_count;
  uint32_t max_depth;
  int is_ended;
  int has_error;
} causeway_chain_summary_t;

typedef struct {
  uint64_t total_duration;      /**< µs */
  uint64_t slowest_event_id;    /**< 0 if no event has completed */
  uint64_t slowest_duration;    /**< µs */
  uint64_t error_count;
  double average_event_duration; /**< µs over completed events, 0 if none */
} causeway_performance_t;

/** One timeline row (start-time order). */
typedef struct {
  uint64_t event_id;
  uint64_t parent_id; /**< 0 for the root */
  uint64_t start_time;
  uint64_t duration;  /**< valid if has_duration */
  uint32_t depth;
  uint32_t child_count;
  uint16_t type;      /**< causeway_event_type_t */
  uint8_t severity;   /**< 0=low, 1=medium, 2=high */
  uint8_t has_duration;
  uint8_t has_error;
} causeway_timeline_entry_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * LIFECYCLE
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Create a tracker.
 * @param[in]  opts        Options, or NULL for defaults.
 * @param[out] out_tracker Receives the handle.
 */
CAUSEWAY_API causeway_error_t
causeway_tracker_create(const causeway_options_t *opts,
                        causeway_tracker_t **out_tracker);

/** Stop the sweeper and free the tracker. NULL is a no-op. */
CAUSEWAY_API causeway_error_t
causeway_tracker_destroy(causeway_tracker_t *tracker);

/* ═══════════════════════════════════════════════════════════════════════════
 * CHAINS & EVENTS
 * ═══════════════════════════════════════════════════════════════════════════
 */

CAUSEWAY_API causeway_error_t causeway_start_chain(causeway_tracker_t *tracker,
                                                   uint16_t type,
                                                   const char *description,
                                                   uint64_t *out_chain_id);

/**
 * @brief Add an event.
 * @param[in] chain_id  Target chain, 0 = active chain (or start a new one).
 * @param[in] parent_id Parent event, 0 = chain's latest event.
 * @return CAUSEWAY_ERR_CHAIN_NOT_FOUND / CAUSEWAY_ERR_EVENT_NOT_FOUND for
 *         unknown explicit ids.
 */
CAUSEWAY_API causeway_error_t causeway_add_event(causeway_tracker_t *tracker,
                                                 uint16_t type,
                                                 const char *description,
                                                 uint64_t chain_id,
                                                 uint64_t parent_id,
                                                 uint64_t *out_event_id);

/**
 * @brief Complete an event. Unknown ids succeed as a no-op.
 * @param[in] error_message NULL for success, otherwise recorded as the
 *                          event's error.
 */
CAUSEWAY_API causeway_error_t
causeway_complete_event(causeway_tracker_t *tracker, uint64_t event_id,
                        const char *error_message);

/** End a chain. Unknown ids succeed as a no-op. */
CAUSEWAY_API causeway_error_t causeway_end_chain(causeway_tracker_t *tracker,
                                                 uint64_t chain_id);

/** Active chain id, 0 if none. */
CAUSEWAY_API causeway_error_t
causeway_current_chain(causeway_tracker_t *tracker, uint64_t *out_chain_id);

/** Run one cleanup pass; either out pointer may be NULL. */
CAUSEWAY_API causeway_error_t causeway_cleanup(causeway_tracker_t *tracker,
                                               size_t *out_expired,
                                               size_t *out_evicted);

/* ═══════════════════════════════════════════════════════════════════════════
 * INTROSPECTION
 * ═══════════════════════════════════════════════════════════════════════════
 */

CAUSEWAY_API causeway_error_t
causeway_chain_count(causeway_tracker_t *tracker, size_t *out_count);

CAUSEWAY_API causeway_error_t
causeway_event_count(causeway_tracker_t *tracker, size_t *out_count);

/** @return CAUSEWAY_ERR_CHAIN_NOT_FOUND for an unknown chain. */
CAUSEWAY_API causeway_error_t
causeway_get_chain_summary(causeway_tracker_t *tracker, uint64_t chain_id,
                           causeway_chain_summary_t *out_summary);

/** All-zero result for an unknown chain. */
CAUSEWAY_API causeway_error_t
causeway_get_performance(causeway_tracker_t *tracker, uint64_t chain_id,
                         causeway_performance_t *out_perf);

/**
 * @brief Copy a chain's timeline into a caller buffer.
 *
 * Returns CAUSEWAY_ERR_BUFFER_TOO_SMALL if max_entries is insufficient;
 * out_count still receives the required count and the first max_entries
 * rows are written. An unknown chain yields zero rows.
 */
CAUSEWAY_API causeway_error_t causeway_get_timeline(
    causeway_tracker_t *tracker, uint64_t chain_id,
    causeway_timeline_entry_t *out_entries, size_t max_entries,
    size_t *out_count);

/** Library version string (static, never freed). */
CAUSEWAY_API const char *causeway_version(void);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* CAUSEWAY_C_API_H */
