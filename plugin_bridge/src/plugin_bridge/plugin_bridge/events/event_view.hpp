#pragma once

#include <plugin_bridge/events/event_types.hpp>

#include <string>
#include <variant>
#include <cassert>
#include <optional>

namespace plugin_bridge {

typedef std::variant<
  note_on_event, note_off_event, note_choke_event, note_end_event,
  note_expression_event, param_value_event, param_mod_event,
  param_gesture_begin_event, param_gesture_end_event, transport_event,
  midi_event, midi_sysex_event, midi2_event> core_event_variant;

// Non-owning view of one record in a list. Only valid during the
// call that handed out the list.
class event_view final {
  clap_event_header const* _header;

public:
  explicit event_view(clap_event_header const* header) : _header(header) { assert(header); }

  std::uint32_t size() const { return _header->size; }
  std::uint32_t time() const { return _header->time; }
  std::uint16_t type() const { return _header->type; }
  std::uint32_t flags() const { return _header->flags; }
  std::uint16_t space_id() const { return _header->space_id; }
  bool is_core() const { return _header->space_id == core_event_space; }
  event_header header() const { return event_header(*_header); }
  clap_event_header const* as_raw() const { return _header; }

  template <class E> bool
  is() const { return E::is_instance(*_header); }

  // empty when the record is something else
  template <class E> std::optional<E>
  as() const
  {
    if (!is<E>()) return std::nullopt;
    return E::from_raw(*_header).to_optional();
  }

  // Empty for other event spaces and unknown core types.
  // Consumers skip these, newer peers may send types we do not know.
  std::optional<core_event_variant> decode() const;
};

// readable form of any record, known or not
std::string describe(event_view const& event);

}
