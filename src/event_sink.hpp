#ifndef KEYREG_EVENT_SINK_HPP
#define KEYREG_EVENT_SINK_HPP

#include <cstddef>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace keyreg {

enum class registry_event_kind {
  constructed,
  appended,
  replaced,
  erased,
  cleared,
  duplicate_rejected,
  key_resolved,
  key_not_found
};

char const*
event_kind_name(registry_event_kind);

struct registry_event {
  registry_event_kind        kind;
  std::string                record_type;
  std::optional<std::size_t> index;
  std::size_t                size = 0;
  std::string                detail;
};

std::string
format_event(registry_event const&);

// Receiver of diagnostic events emitted by registries. Events are purely
// informational; a sink can't influence the operation that emitted them.
class event_sink {
public:
  virtual
  ~event_sink() = default;

  virtual void
  record(registry_event const&) = 0;
};

// Prints one line per event.
class printing_event_sink : public event_sink {
public:
  explicit
  printing_event_sink(std::FILE* out = stderr) : out_{out} { }

  void
  record(registry_event const&) override;

private:
  std::FILE* out_;
};

// Keeps every event in memory.
class recording_event_sink : public event_sink {
public:
  void
  record(registry_event const& e) override { events_.push_back(e); }

  std::vector<registry_event> const&
  events() const { return events_; }

  void
  clear() { events_.clear(); }

private:
  std::vector<registry_event> events_;
};

} // namespace keyreg

#endif
