#include <plugin_bridge/events/event_view.hpp>

namespace plugin_bridge {

template <class E> static std::optional<core_event_variant>
decode_as(clap_event_header const& header)
{
  auto decoded = E::from_raw(header);
  if (!decoded.ok()) return std::nullopt;
  return core_event_variant(decoded.value());
}

std::optional<core_event_variant>
event_view::decode() const
{
  if (!is_core()) return std::nullopt;
  switch (static_cast<core_event_type>(_header->type))
  {
  case core_event_type::note_on: return decode_as<note_on_event>(*_header);
  case core_event_type::note_off: return decode_as<note_off_event>(*_header);
  case core_event_type::note_choke: return decode_as<note_choke_event>(*_header);
  case core_event_type::note_end: return decode_as<note_end_event>(*_header);
  case core_event_type::note_expression: return decode_as<note_expression_event>(*_header);
  case core_event_type::param_value: return decode_as<param_value_event>(*_header);
  case core_event_type::param_mod: return decode_as<param_mod_event>(*_header);
  case core_event_type::param_gesture_begin: return decode_as<param_gesture_begin_event>(*_header);
  case core_event_type::param_gesture_end: return decode_as<param_gesture_end_event>(*_header);
  case core_event_type::transport: return decode_as<transport_event>(*_header);
  case core_event_type::midi: return decode_as<midi_event>(*_header);
  case core_event_type::midi_sysex: return decode_as<midi_sysex_event>(*_header);
  case core_event_type::midi2: return decode_as<midi2_event>(*_header);
  default: return std::nullopt;
  }
}

std::string
describe(event_view const& event)
{
  auto decoded = event.decode();
  if (decoded)
    return std::visit([](auto const& e) { return e.describe(); }, *decoded);
  return "opaque { space_id: " + std::to_string(event.space_id()) +
    ", type: " + std::to_string(event.type()) +
    ", time: " + std::to_string(event.time()) +
    ", size: " + std::to_string(event.size()) + " }";
}

}
