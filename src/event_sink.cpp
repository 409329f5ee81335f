#include "event_sink.hpp"

#include <fmt/format.h>

namespace keyreg {

char const*
event_kind_name(registry_event_kind kind) {
  switch (kind) {
  case registry_event_kind::constructed:        return "constructed";
  case registry_event_kind::appended:           return "appended";
  case registry_event_kind::replaced:           return "replaced";
  case registry_event_kind::erased:             return "erased";
  case registry_event_kind::cleared:            return "cleared";
  case registry_event_kind::duplicate_rejected: return "duplicate-rejected";
  case registry_event_kind::key_resolved:       return "key-resolved";
  case registry_event_kind::key_not_found:      return "key-not-found";
  }

  return "unknown";
}

std::string
format_event(registry_event const& e) {
  std::string result = fmt::format("Registry<{}>: {}", e.record_type,
                                   event_kind_name(e.kind));
  if (e.index)
    result += fmt::format(" at {}", *e.index);
  result += fmt::format(", {} records", e.size);
  if (!e.detail.empty())
    result += fmt::format(" -- {}", e.detail);
  return result;
}

void
printing_event_sink::record(registry_event const& e) {
  fmt::print(out_, "{}\n", format_event(e));
}

} // namespace keyreg
