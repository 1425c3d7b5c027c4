#pragma once

#include <clap/events.h>

#include <cstddef>
#include <cstdint>

namespace plugin_bridge {

// Every record starts with this, any toolchain must agree on it.
static_assert(sizeof(clap_event_header) == 16);
static_assert(offsetof(clap_event_header, size) == 0);
static_assert(offsetof(clap_event_header, time) == 4);
static_assert(offsetof(clap_event_header, space_id) == 8);
static_assert(offsetof(clap_event_header, type) == 10);
static_assert(offsetof(clap_event_header, flags) == 12);

inline std::uint16_t constexpr core_event_space = CLAP_CORE_EVENT_SPACE_ID;

// only meaningful together with core_event_space
enum class core_event_type : std::uint16_t {
  note_on = CLAP_EVENT_NOTE_ON,
  note_off = CLAP_EVENT_NOTE_OFF,
  note_choke = CLAP_EVENT_NOTE_CHOKE,
  note_end = CLAP_EVENT_NOTE_END,
  note_expression = CLAP_EVENT_NOTE_EXPRESSION,
  param_value = CLAP_EVENT_PARAM_VALUE,
  param_mod = CLAP_EVENT_PARAM_MOD,
  param_gesture_begin = CLAP_EVENT_PARAM_GESTURE_BEGIN,
  param_gesture_end = CLAP_EVENT_PARAM_GESTURE_END,
  transport = CLAP_EVENT_TRANSPORT,
  midi = CLAP_EVENT_MIDI,
  midi_sysex = CLAP_EVENT_MIDI_SYSEX,
  midi2 = CLAP_EVENT_MIDI2 };

enum event_flags : std::uint32_t {
  event_flags_none = 0,
  event_flags_is_live = CLAP_EVENT_IS_LIVE,
  event_flags_dont_record = CLAP_EVENT_DONT_RECORD };

char const* core_event_type_name(core_event_type type);

// value copy of a record header
class event_header final {
  clap_event_header _raw = {};

public:
  event_header() = default;
  explicit event_header(clap_event_header const& raw) : _raw(raw) {}
  event_header(std::uint32_t size, std::uint32_t time, std::uint16_t space_id, std::uint16_t type, std::uint32_t flags)
  { _raw.size = size; _raw.time = time; _raw.space_id = space_id; _raw.type = type; _raw.flags = flags; }

  std::uint32_t size() const { return _raw.size; }
  std::uint32_t time() const { return _raw.time; }
  std::uint16_t type() const { return _raw.type; }
  std::uint32_t flags() const { return _raw.flags; }
  std::uint16_t space_id() const { return _raw.space_id; }
  clap_event_header const& as_raw() const { return _raw; }

  bool is_core() const { return _raw.space_id == core_event_space; }
  bool is_live() const { return (_raw.flags & event_flags_is_live) != 0; }
  bool dont_record() const { return (_raw.flags & event_flags_dont_record) != 0; }
};

}
