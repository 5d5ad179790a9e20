#include "causeway/options.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace causeway {

uint64_t steady_now_micros() {
  auto now = std::chrono::steady_clock::now();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          now.time_since_epoch())
          .count());
}

namespace {

std::optional<uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == '\0')
    return std::nullopt;

  char *end = nullptr;
  errno = 0;
  unsigned long long value = std::strtoull(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0' || raw[0] == '-') {
    spdlog::warn("causeway: ignoring {}='{}' (not an unsigned integer)", name,
                 raw);
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

std::optional<bool> env_bool(const char *name) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == '\0')
    return std::nullopt;

  std::string value(raw);
  for (auto &c : value)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  if (value == "1" || value == "true" || value == "on" || value == "yes")
    return true;
  if (value == "0" || value == "false" || value == "off" || value == "no")
    return false;

  spdlog::warn("causeway: ignoring {}='{}' (not a boolean)", name, raw);
  return std::nullopt;
}

} // namespace

TrackerOptions TrackerOptions::from_env() {
  TrackerOptions opts;

  if (auto v = env_u64("CAUSEWAY_MAX_CHAIN_LENGTH"); v && *v > 0)
    opts.max_chain_length = static_cast<size_t>(*v);
  if (auto v = env_u64("CAUSEWAY_MAX_CHAIN_DURATION_MS"); v && *v > 0)
    opts.max_chain_duration = std::chrono::milliseconds(*v);
  if (auto v = env_u64("CAUSEWAY_MAX_CHAINS"); v && *v > 0)
    opts.max_chains_in_memory = static_cast<size_t>(*v);
  if (auto v = env_u64("CAUSEWAY_CLEANUP_INTERVAL_MS"); v && *v > 0)
    opts.cleanup_interval = std::chrono::milliseconds(*v);
  if (auto v = env_bool("CAUSEWAY_CLEANUP_TIMER"))
    opts.enable_cleanup_timer = *v;

  return opts;
}

void TrackerOptions::validate() const {
  if (max_chain_length == 0)
    throw std::invalid_argument("max_chain_length must be positive");
  if (max_chains_in_memory == 0)
    throw std::invalid_argument("max_chains_in_memory must be positive");
  if (max_chain_duration.count() <= 0)
    throw std::invalid_argument("max_chain_duration must be positive");
  if (enable_cleanup_timer && cleanup_interval.count() <= 0)
    throw std::invalid_argument("cleanup_interval must be positive");
}

} // namespace causeway
