#include "causeway/log_bridge.hpp"

#include <utility>

namespace causeway {

std::string format_log_fields(const LogFields &fields) {
  std::string out;
  for (const auto &[key, value] : fields) {
    if (!out.empty())
      out += ' ';
    out += key;
    out += '=';
    out += value;
  }
  return out;
}

void CausalityFlagFormatter::format(const spdlog::details::log_msg &,
                                    const std::tm &,
                                    spdlog::memory_buf_t &dest) {
  if (!tracker_)
    return;

  LogFields fields = tracker_->get_causality_context();
  if (fields.empty())
    return;

  std::string text = " " + format_log_fields(fields);
  dest.append(text.data(), text.data() + text.size());
}

std::unique_ptr<spdlog::custom_flag_formatter>
CausalityFlagFormatter::clone() const {
  return std::make_unique<CausalityFlagFormatter>(tracker_);
}

void install_causality_pattern(spdlog::logger &logger,
                               const CausalityTracker &tracker,
                               std::string pattern) {
  auto formatter = std::make_unique<spdlog::pattern_formatter>();
  formatter->add_flag<CausalityFlagFormatter>(CAUSALITY_FLAG, &tracker)
      .set_pattern(std::move(pattern));
  logger.set_formatter(std::move(formatter));
}

} // namespace causeway
