#pragma once

/**
 * @file log_bridge.hpp
 * @brief Render causality context into spdlog output.
 *
 * Usage:
 * @code
 *   causeway::install_causality_pattern(*spdlog::default_logger(), tracker,
 *                                       "[%l] %v%*");
 *   spdlog::info("saved");   // "[info] saved causalityChainId=3 ..."
 * @endcode
 */

#include "causeway/tracker.hpp"

#include <spdlog/logger.h>
#include <spdlog/pattern_formatter.h>

#include <memory>
#include <string>

namespace causeway {

/// Pattern flag rendered by CausalityFlagFormatter.
inline constexpr char CAUSALITY_FLAG = '*';

/// "key=value" pairs separated by single spaces, keys in sorted order.
std::string format_log_fields(const LogFields &fields);

/**
 * @brief spdlog flag that appends " key=value ..." for the active chain.
 *
 * Renders nothing when no chain is active. The tracker must outlive every
 * logger the flag is installed on.
 */
class CausalityFlagFormatter : public spdlog::custom_flag_formatter {
public:
  explicit CausalityFlagFormatter(const CausalityTracker *tracker)
      : tracker_(tracker) {}

  void format(const spdlog::details::log_msg &msg, const std::tm &tm_time,
              spdlog::memory_buf_t &dest) override;

  std::unique_ptr<spdlog::custom_flag_formatter> clone() const override;

private:
  const CausalityTracker *tracker_;
};

/// Give `logger` a pattern formatter with CAUSALITY_FLAG bound to `tracker`.
void install_causality_pattern(spdlog::logger &logger,
                               const CausalityTracker &tracker,
                               std::string pattern);

} // namespace causeway
