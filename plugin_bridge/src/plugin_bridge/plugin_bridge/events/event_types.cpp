#include <plugin_bridge/events/event_types.hpp>

#include <ostream>
#include <iomanip>

namespace plugin_bridge {

char const*
core_event_type_name(core_event_type type)
{
  switch (type)
  {
  case core_event_type::note_on: return "note_on";
  case core_event_type::note_off: return "note_off";
  case core_event_type::note_choke: return "note_choke";
  case core_event_type::note_end: return "note_end";
  case core_event_type::note_expression: return "note_expression";
  case core_event_type::param_value: return "param_value";
  case core_event_type::param_mod: return "param_mod";
  case core_event_type::param_gesture_begin: return "param_gesture_begin";
  case core_event_type::param_gesture_end: return "param_gesture_end";
  case core_event_type::transport: return "transport";
  case core_event_type::midi: return "midi";
  case core_event_type::midi_sysex: return "midi_sysex";
  case core_event_type::midi2: return "midi2";
  default: return "unknown";
  }
}

char const*
event_error_text(event_error error)
{
  switch (error)
  {
  case event_error::space_mismatch: return "Event belongs to another event space.";
  case event_error::type_mismatch: return "Event type does not match the requested variant.";
  case event_error::size_mismatch: return "Event record is smaller than the requested variant.";
  default: return "Unknown event error.";
  }
}

static void
describe_match(std::ostream& stream, char const* name, std::int32_t raw)
{
  stream << ", " << name << ": ";
  if (raw < 0) stream << "all";
  else stream << raw;
}

void
describe_address(std::ostream& stream, pckn const& address)
{
  describe_match(stream, "port", address.raw_port());
  describe_match(stream, "channel", address.raw_channel());
  describe_match(stream, "key", address.raw_key());
  describe_match(stream, "note_id", address.raw_note_id());
}

note_expression_event::
note_expression_event(std::uint32_t time, note_expression expression, pckn const& address, double value):
base(time)
{
  _raw.expression_id = static_cast<clap_note_expression>(expression);
  _raw.note_id = address.raw_note_id();
  _raw.port_index = address.raw_port();
  _raw.channel = address.raw_channel();
  _raw.key = address.raw_key();
  _raw.value = value;
}

void
note_expression_event::describe_payload(std::ostream& stream) const
{
  stream << ", expression: " << _raw.expression_id;
  describe_address(stream, address());
  stream << ", value: " << value();
}

bool
operator==(note_expression_event const& l, note_expression_event const& r)
{
  return l._raw.expression_id == r._raw.expression_id && l._raw.note_id == r._raw.note_id &&
    l._raw.port_index == r._raw.port_index && l._raw.channel == r._raw.channel &&
    l._raw.key == r._raw.key && l._raw.value == r._raw.value;
}

param_value_event::
param_value_event(std::uint32_t time, clap_id param_id, pckn const& address, double value, void* cookie):
base(time)
{
  _raw.param_id = param_id;
  _raw.cookie = cookie;
  _raw.note_id = address.raw_note_id();
  _raw.port_index = address.raw_port();
  _raw.channel = address.raw_channel();
  _raw.key = address.raw_key();
  _raw.value = value;
}

void
param_value_event::describe_payload(std::ostream& stream) const
{
  stream << ", param_id: " << param_id();
  describe_address(stream, address());
  stream << ", value: " << value();
}

bool
operator==(param_value_event const& l, param_value_event const& r)
{
  return l._raw.param_id == r._raw.param_id && l._raw.cookie == r._raw.cookie &&
    l._raw.note_id == r._raw.note_id && l._raw.port_index == r._raw.port_index &&
    l._raw.channel == r._raw.channel && l._raw.key == r._raw.key && l._raw.value == r._raw.value;
}

param_mod_event::
param_mod_event(std::uint32_t time, clap_id param_id, pckn const& address, double amount, void* cookie):
base(time)
{
  _raw.param_id = param_id;
  _raw.cookie = cookie;
  _raw.note_id = address.raw_note_id();
  _raw.port_index = address.raw_port();
  _raw.channel = address.raw_channel();
  _raw.key = address.raw_key();
  _raw.amount = amount;
}

void
param_mod_event::describe_payload(std::ostream& stream) const
{
  stream << ", param_id: " << param_id();
  describe_address(stream, address());
  stream << ", amount: " << amount();
}

bool
operator==(param_mod_event const& l, param_mod_event const& r)
{
  return l._raw.param_id == r._raw.param_id && l._raw.cookie == r._raw.cookie &&
    l._raw.note_id == r._raw.note_id && l._raw.port_index == r._raw.port_index &&
    l._raw.channel == r._raw.channel && l._raw.key == r._raw.key && l._raw.amount == r._raw.amount;
}

transport_event
transport_event::with_playing(bool playing) const
{
  transport_event result(*this);
  if (playing) result._raw.flags |= CLAP_TRANSPORT_IS_PLAYING;
  else result._raw.flags &= ~static_cast<clap_transport_flags>(CLAP_TRANSPORT_IS_PLAYING);
  return result;
}

transport_event
transport_event::with_tempo(double tempo, double tempo_inc) const
{
  transport_event result(*this);
  result._raw.tempo = tempo;
  result._raw.tempo_inc = tempo_inc;
  result._raw.flags |= CLAP_TRANSPORT_HAS_TEMPO;
  return result;
}

transport_event
transport_event::with_time_signature(std::uint16_t numerator, std::uint16_t denominator) const
{
  transport_event result(*this);
  result._raw.tsig_num = numerator;
  result._raw.tsig_denom = denominator;
  result._raw.flags |= CLAP_TRANSPORT_HAS_TIME_SIGNATURE;
  return result;
}

void
transport_event::describe_payload(std::ostream& stream) const
{
  stream << ", transport_flags: " << transport_flags() << ", tempo: " << tempo();
  stream << ", bar: " << bar_number() << ", signature: " << time_signature_numerator() << "/" << time_signature_denominator();
}

bool
operator==(transport_event const& l, transport_event const& r)
{
  return l._raw.flags == r._raw.flags &&
    l._raw.song_pos_beats == r._raw.song_pos_beats && l._raw.song_pos_seconds == r._raw.song_pos_seconds &&
    l._raw.tempo == r._raw.tempo && l._raw.tempo_inc == r._raw.tempo_inc &&
    l._raw.loop_start_beats == r._raw.loop_start_beats && l._raw.loop_end_beats == r._raw.loop_end_beats &&
    l._raw.loop_start_seconds == r._raw.loop_start_seconds && l._raw.loop_end_seconds == r._raw.loop_end_seconds &&
    l._raw.bar_start == r._raw.bar_start && l._raw.bar_number == r._raw.bar_number &&
    l._raw.tsig_num == r._raw.tsig_num && l._raw.tsig_denom == r._raw.tsig_denom;
}

midi_event::
midi_event(std::uint32_t time, std::uint16_t port_index, std::array<std::uint8_t, 3> const& data):
base(time)
{
  _raw.port_index = port_index;
  for (int i = 0; i < 3; i++)
    _raw.data[i] = data[i];
}

void
midi_event::describe_payload(std::ostream& stream) const
{
  stream << ", port_index: " << port_index() << ", data: " << std::hex;
  for (int i = 0; i < 3; i++)
    stream << std::setw(2) << std::setfill('0') << static_cast<int>(_raw.data[i]);
  stream << std::dec;
}

bool
operator==(midi_event const& l, midi_event const& r)
{
  return l._raw.port_index == r._raw.port_index &&
    l._raw.data[0] == r._raw.data[0] && l._raw.data[1] == r._raw.data[1] && l._raw.data[2] == r._raw.data[2];
}

midi_sysex_event::
midi_sysex_event(std::uint32_t time, std::uint16_t port_index, std::uint8_t const* buffer, std::uint32_t size):
base(time)
{
  _raw.port_index = port_index;
  _raw.buffer = buffer;
  _raw.size = size;
}

void
midi_sysex_event::describe_payload(std::ostream& stream) const
{ stream << ", port_index: " << port_index() << ", size: " << buffer_size(); }

// compares contents, not addresses
bool
operator==(midi_sysex_event const& l, midi_sysex_event const& r)
{
  if (l._raw.port_index != r._raw.port_index || l._raw.size != r._raw.size) return false;
  if (l._raw.size == 0 || l._raw.buffer == r._raw.buffer) return true;
  if (l._raw.buffer == nullptr || r._raw.buffer == nullptr) return false;
  return std::memcmp(l._raw.buffer, r._raw.buffer, l._raw.size) == 0;
}

midi2_event::
midi2_event(std::uint32_t time, std::uint16_t port_index, std::array<std::uint32_t, 4> const& data):
base(time)
{
  _raw.port_index = port_index;
  for (int i = 0; i < 4; i++)
    _raw.data[i] = data[i];
}

void
midi2_event::describe_payload(std::ostream& stream) const
{
  stream << ", port_index: " << port_index() << ", data: " << std::hex;
  for (int i = 0; i < 4; i++)
    stream << (i == 0? "": " ") << std::setw(8) << std::setfill('0') << _raw.data[i];
  stream << std::dec;
}

bool
operator==(midi2_event const& l, midi2_event const& r)
{
  if (l._raw.port_index != r._raw.port_index) return false;
  for (int i = 0; i < 4; i++)
    if (l._raw.data[i] != r._raw.data[i]) return false;
  return true;
}

}
