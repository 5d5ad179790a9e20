#include "causeway/schema.hpp"

#include <algorithm>
#include <array>

namespace causeway {

namespace {

constexpr std::array<std::string_view, CAUSAL_EVENT_TYPE_COUNT> EVENT_TYPE_NAMES =
    {
        "user_action",  "api_call",     "state_change", "render",
        "async_operation", "system_event", "error",     "performance",
        "navigation",   "websocket",    "custom",
};

} // namespace

std::string_view to_string(CausalEventType type) noexcept {
  auto index = static_cast<size_t>(type);
  if (index >= EVENT_TYPE_NAMES.size())
    return "custom";
  return EVENT_TYPE_NAMES[index];
}

std::string_view to_string(Severity severity) noexcept {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  }
  return "medium";
}

std::optional<CausalEventType> parse_event_type(std::string_view name) noexcept {
  for (size_t i = 0; i < EVENT_TYPE_NAMES.size(); ++i) {
    if (EVENT_TYPE_NAMES[i] == name)
      return static_cast<CausalEventType>(i);
  }
  return std::nullopt;
}

// ===========================================================================
// CausalityChain
// ===========================================================================

const CausalEvent *CausalityChain::find(EventId event_id) const noexcept {
  // IDs are monotonic within a chain, so the arena is sorted by id.
  auto it = std::lower_bound(
      events.begin(), events.end(), event_id,
      [](const CausalEvent &ev, EventId id) { return ev.id < id; });
  if (it == events.end() || it->id != event_id)
    return nullptr;
  return &*it;
}

EventId CausalityChain::parent_id(const CausalEvent &event) const noexcept {
  if (!event.parent || *event.parent >= events.size())
    return INVALID_ID;
  return events[*event.parent].id;
}

std::vector<EventId> CausalityChain::child_ids(const CausalEvent &event) const {
  std::vector<EventId> ids;
  ids.reserve(event.children.size());
  for (uint32_t slot : event.children) {
    if (slot < events.size())
      ids.push_back(events[slot].id);
  }
  return ids;
}

bool CausalityChain::has_error() const noexcept {
  return std::any_of(events.begin(), events.end(),
                     [](const CausalEvent &ev) { return ev.has_error(); });
}

} // namespace causeway
