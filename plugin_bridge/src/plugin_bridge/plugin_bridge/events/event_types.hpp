#pragma once

#include <plugin_bridge/events/pckn.hpp>
#include <plugin_bridge/events/event_header.hpp>
#include <plugin_bridge/shared/result.hpp>

#include <clap/events.h>

#include <array>
#include <string>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <sstream>

namespace plugin_bridge {

// A caller asserted a variant that the record is not.
enum class event_error { space_mismatch, type_mismatch, size_mismatch };
char const* event_error_text(event_error error);

enum class note_expression : std::int32_t {
  volume = CLAP_NOTE_EXPRESSION_VOLUME,
  pan = CLAP_NOTE_EXPRESSION_PAN,
  tuning = CLAP_NOTE_EXPRESSION_TUNING,
  vibrato = CLAP_NOTE_EXPRESSION_VIBRATO,
  expression = CLAP_NOTE_EXPRESSION_EXPRESSION,
  brightness = CLAP_NOTE_EXPRESSION_BRIGHTNESS,
  pressure = CLAP_NOTE_EXPRESSION_PRESSURE };

// Shared implementation of all core variants: tagging, raw conversion,
// header access and formatting. Derived adds payload accessors,
// payload equality and describe_payload(std::ostream&).
template <class Derived, class Raw, core_event_type Type>
class core_event {
  static_assert(offsetof(Raw, header) == 0);

protected:
  Raw _raw = {};

  core_event() : core_event(0) {}
  explicit core_event(std::uint32_t time)
  {
    _raw.header.size = sizeof(Raw);
    _raw.header.time = time;
    _raw.header.space_id = core_event_space;
    _raw.header.type = static_cast<std::uint16_t>(Type);
    _raw.header.flags = 0;
  }

public:
  typedef Raw raw_type;
  static core_event_type constexpr type = Type;

  static bool
  is_instance(clap_event_header const& header)
  {
    return header.space_id == core_event_space &&
      header.type == static_cast<std::uint16_t>(Type) &&
      header.size >= sizeof(Raw);
  }

  // header must front a record of at least header.size bytes
  static result<Derived, event_error>
  from_raw(clap_event_header const& header)
  {
    if (header.space_id != core_event_space) return event_error::space_mismatch;
    if (header.type != static_cast<std::uint16_t>(Type)) return event_error::type_mismatch;
    if (header.size < sizeof(Raw)) return event_error::size_mismatch;
    Derived event;
    std::memcpy(&static_cast<core_event&>(event)._raw, &header, sizeof(Raw));
    return event;
  }

  static result<Derived, event_error>
  from_raw(Raw const& raw)
  { return from_raw(raw.header); }

  event_header header() const { return event_header(_raw.header); }
  std::uint32_t time() const { return _raw.header.time; }
  std::uint32_t flags() const { return _raw.header.flags; }
  bool is_live() const { return (_raw.header.flags & event_flags_is_live) != 0; }

  Raw into_raw() const { return _raw; }
  Raw const& as_raw() const { return _raw; }
  clap_event_header const* as_header() const { return &_raw.header; }

  Derived
  with_flags(std::uint32_t flags) const
  {
    Derived result(static_cast<Derived const&>(*this));
    static_cast<core_event&>(result)._raw.header.flags = flags;
    return result;
  }

  Derived
  with_time(std::uint32_t time) const
  {
    Derived result(static_cast<Derived const&>(*this));
    static_cast<core_event&>(result)._raw.header.time = time;
    return result;
  }

  std::string
  describe() const
  {
    std::ostringstream stream;
    stream << core_event_type_name(Type) << " { time: " << time() << ", flags: " << flags();
    static_cast<Derived const&>(*this).describe_payload(stream);
    stream << " }";
    return stream.str();
  }
};

void describe_address(std::ostream& stream, pckn const& address);

template <core_event_type Type>
class note_event final:
public core_event<note_event<Type>, clap_event_note, Type>
{
  static_assert(
    Type == core_event_type::note_on || Type == core_event_type::note_off ||
    Type == core_event_type::note_choke || Type == core_event_type::note_end);
  typedef core_event<note_event<Type>, clap_event_note, Type> base;

public:
  note_event() = default;
  note_event(std::uint32_t time, pckn const& address, double velocity) : base(time)
  {
    this->_raw.port_index = address.raw_port();
    this->_raw.channel = address.raw_channel();
    this->_raw.key = address.raw_key();
    this->_raw.note_id = address.raw_note_id();
    this->_raw.velocity = velocity;
  }

  match16 port() const { return match16::from_raw(this->_raw.port_index); }
  match16 channel() const { return match16::from_raw(this->_raw.channel); }
  match16 key() const { return match16::from_raw(this->_raw.key); }
  match32 note_id() const { return match32::from_raw(this->_raw.note_id); }
  double velocity() const { return this->_raw.velocity; }

  pckn address() const
  { return pckn::from_raw(this->_raw.port_index, this->_raw.channel, this->_raw.key, this->_raw.note_id); }

  note_event
  with_velocity(double velocity) const
  {
    note_event result(*this);
    result._raw.velocity = velocity;
    return result;
  }

  void describe_payload(std::ostream& stream) const
  {
    describe_address(stream, address());
    stream << ", velocity: " << velocity();
  }

  friend bool operator==(note_event const& l, note_event const& r)
  {
    return l._raw.key == r._raw.key && l._raw.channel == r._raw.channel &&
      l._raw.port_index == r._raw.port_index && l._raw.velocity == r._raw.velocity &&
      l._raw.note_id == r._raw.note_id;
  }
  friend bool operator!=(note_event const& l, note_event const& r) { return !(l == r); }
};

typedef note_event<core_event_type::note_on> note_on_event;
typedef note_event<core_event_type::note_off> note_off_event;
typedef note_event<core_event_type::note_end> note_end_event;
typedef note_event<core_event_type::note_choke> note_choke_event;

class note_expression_event final:
public core_event<note_expression_event, clap_event_note_expression, core_event_type::note_expression>
{
  typedef core_event<note_expression_event, clap_event_note_expression, core_event_type::note_expression> base;

public:
  note_expression_event() = default;
  note_expression_event(std::uint32_t time, note_expression expression, pckn const& address, double value);

  note_expression expression() const { return static_cast<note_expression>(_raw.expression_id); }
  match16 port() const { return match16::from_raw(_raw.port_index); }
  match16 channel() const { return match16::from_raw(_raw.channel); }
  match16 key() const { return match16::from_raw(_raw.key); }
  match32 note_id() const { return match32::from_raw(_raw.note_id); }
  pckn address() const { return pckn::from_raw(_raw.port_index, _raw.channel, _raw.key, _raw.note_id); }
  double value() const { return _raw.value; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(note_expression_event const& l, note_expression_event const& r);
  friend bool operator!=(note_expression_event const& l, note_expression_event const& r) { return !(l == r); }
};

class param_value_event final:
public core_event<param_value_event, clap_event_param_value, core_event_type::param_value>
{
  typedef core_event<param_value_event, clap_event_param_value, core_event_type::param_value> base;

public:
  param_value_event() = default;
  param_value_event(std::uint32_t time, clap_id param_id, pckn const& address, double value, void* cookie = nullptr);

  clap_id param_id() const { return _raw.param_id; }
  void* cookie() const { return _raw.cookie; }
  match16 port() const { return match16::from_raw(_raw.port_index); }
  match16 channel() const { return match16::from_raw(_raw.channel); }
  match16 key() const { return match16::from_raw(_raw.key); }
  match32 note_id() const { return match32::from_raw(_raw.note_id); }
  pckn address() const { return pckn::from_raw(_raw.port_index, _raw.channel, _raw.key, _raw.note_id); }
  double value() const { return _raw.value; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(param_value_event const& l, param_value_event const& r);
  friend bool operator!=(param_value_event const& l, param_value_event const& r) { return !(l == r); }
};

class param_mod_event final:
public core_event<param_mod_event, clap_event_param_mod, core_event_type::param_mod>
{
  typedef core_event<param_mod_event, clap_event_param_mod, core_event_type::param_mod> base;

public:
  param_mod_event() = default;
  param_mod_event(std::uint32_t time, clap_id param_id, pckn const& address, double amount, void* cookie = nullptr);

  clap_id param_id() const { return _raw.param_id; }
  void* cookie() const { return _raw.cookie; }
  match16 port() const { return match16::from_raw(_raw.port_index); }
  match16 channel() const { return match16::from_raw(_raw.channel); }
  match16 key() const { return match16::from_raw(_raw.key); }
  match32 note_id() const { return match32::from_raw(_raw.note_id); }
  pckn address() const { return pckn::from_raw(_raw.port_index, _raw.channel, _raw.key, _raw.note_id); }
  double amount() const { return _raw.amount; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(param_mod_event const& l, param_mod_event const& r);
  friend bool operator!=(param_mod_event const& l, param_mod_event const& r) { return !(l == r); }
};

template <core_event_type Type>
class param_gesture_event final:
public core_event<param_gesture_event<Type>, clap_event_param_gesture, Type>
{
  static_assert(Type == core_event_type::param_gesture_begin || Type == core_event_type::param_gesture_end);
  typedef core_event<param_gesture_event<Type>, clap_event_param_gesture, Type> base;

public:
  param_gesture_event() = default;
  param_gesture_event(std::uint32_t time, clap_id param_id) : base(time)
  { this->_raw.param_id = param_id; }

  clap_id param_id() const { return this->_raw.param_id; }
  void describe_payload(std::ostream& stream) const { stream << ", param_id: " << param_id(); }

  friend bool operator==(param_gesture_event const& l, param_gesture_event const& r)
  { return l._raw.param_id == r._raw.param_id; }
  friend bool operator!=(param_gesture_event const& l, param_gesture_event const& r) { return !(l == r); }
};

typedef param_gesture_event<core_event_type::param_gesture_end> param_gesture_end_event;
typedef param_gesture_event<core_event_type::param_gesture_begin> param_gesture_begin_event;

class transport_event final:
public core_event<transport_event, clap_event_transport, core_event_type::transport>
{
  typedef core_event<transport_event, clap_event_transport, core_event_type::transport> base;

public:
  transport_event() = default;
  explicit transport_event(std::uint32_t time) : base(time) {}

  std::uint32_t transport_flags() const { return _raw.flags; }
  bool is_playing() const { return (_raw.flags & CLAP_TRANSPORT_IS_PLAYING) != 0; }
  bool has_tempo() const { return (_raw.flags & CLAP_TRANSPORT_HAS_TEMPO) != 0; }
  bool has_time_signature() const { return (_raw.flags & CLAP_TRANSPORT_HAS_TIME_SIGNATURE) != 0; }

  double tempo() const { return _raw.tempo; }
  double tempo_inc() const { return _raw.tempo_inc; }
  clap_beattime bar_start() const { return _raw.bar_start; }
  std::int32_t bar_number() const { return _raw.bar_number; }
  clap_beattime song_pos_beats() const { return _raw.song_pos_beats; }
  clap_sectime song_pos_seconds() const { return _raw.song_pos_seconds; }
  std::uint16_t time_signature_numerator() const { return _raw.tsig_num; }
  std::uint16_t time_signature_denominator() const { return _raw.tsig_denom; }

  transport_event with_playing(bool playing) const;
  transport_event with_tempo(double tempo, double tempo_inc) const;
  transport_event with_time_signature(std::uint16_t numerator, std::uint16_t denominator) const;

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(transport_event const& l, transport_event const& r);
  friend bool operator!=(transport_event const& l, transport_event const& r) { return !(l == r); }
};

class midi_event final:
public core_event<midi_event, clap_event_midi, core_event_type::midi>
{
  typedef core_event<midi_event, clap_event_midi, core_event_type::midi> base;

public:
  midi_event() = default;
  midi_event(std::uint32_t time, std::uint16_t port_index, std::array<std::uint8_t, 3> const& data);

  std::uint16_t port_index() const { return _raw.port_index; }
  std::array<std::uint8_t, 3> data() const { return { _raw.data[0], _raw.data[1], _raw.data[2] }; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(midi_event const& l, midi_event const& r);
  friend bool operator!=(midi_event const& l, midi_event const& r) { return !(l == r); }
};

// does not own the sysex bytes, they live as long as the list they came from
class midi_sysex_event final:
public core_event<midi_sysex_event, clap_event_midi_sysex, core_event_type::midi_sysex>
{
  typedef core_event<midi_sysex_event, clap_event_midi_sysex, core_event_type::midi_sysex> base;

public:
  midi_sysex_event() = default;
  midi_sysex_event(std::uint32_t time, std::uint16_t port_index, std::uint8_t const* buffer, std::uint32_t size);

  std::uint16_t port_index() const { return _raw.port_index; }
  std::uint8_t const* buffer() const { return _raw.buffer; }
  std::uint32_t buffer_size() const { return _raw.size; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(midi_sysex_event const& l, midi_sysex_event const& r);
  friend bool operator!=(midi_sysex_event const& l, midi_sysex_event const& r) { return !(l == r); }
};

class midi2_event final:
public core_event<midi2_event, clap_event_midi2, core_event_type::midi2>
{
  typedef core_event<midi2_event, clap_event_midi2, core_event_type::midi2> base;

public:
  midi2_event() = default;
  midi2_event(std::uint32_t time, std::uint16_t port_index, std::array<std::uint32_t, 4> const& data);

  std::uint16_t port_index() const { return _raw.port_index; }
  std::array<std::uint32_t, 4> data() const { return { _raw.data[0], _raw.data[1], _raw.data[2], _raw.data[3] }; }

  void describe_payload(std::ostream& stream) const;
  friend bool operator==(midi2_event const& l, midi2_event const& r);
  friend bool operator!=(midi2_event const& l, midi2_event const& r) { return !(l == r); }
};

}
