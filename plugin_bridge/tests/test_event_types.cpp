#include <plugin_bridge/events/event_types.hpp>
#include <plugin_bridge/events/event_view.hpp>

#include <catch2/catch.hpp>
#include <cstring>

using namespace plugin_bridge;

TEST_CASE("event constructors fill the header", "[events]")
{
  note_on_event note(10, pckn(0, 1, 60, 7), 0.8);
  REQUIRE(note.time() == 10);
  REQUIRE(note.flags() == 0);
  REQUIRE(note.as_raw().header.size == sizeof(clap_event_note));
  REQUIRE(note.as_raw().header.space_id == CLAP_CORE_EVENT_SPACE_ID);
  REQUIRE(note.as_raw().header.type == CLAP_EVENT_NOTE_ON);
  REQUIRE(note.address() == pckn(0, 1, 60, 7));
  REQUIRE(note.velocity() == 0.8);

  param_value_event param(3, 42, pckn::match_all(), 0.25);
  REQUIRE(param.param_id() == 42);
  REQUIRE(param.address() == pckn::match_all());
  REQUIRE(param.as_raw().key == -1);
  REQUIRE(param.as_raw().note_id == -1);
  REQUIRE(param.cookie() == nullptr);
}

TEST_CASE("from_raw rejects other variants", "[events]")
{
  note_on_event note(0, pckn(0, 0, 60, match32::all()), 1.0);

  SECTION("other type")
  {
    auto off = note_off_event::from_raw(note.as_raw().header);
    REQUIRE_FALSE(off.ok());
    REQUIRE(off.error() == event_error::type_mismatch);
  }

  SECTION("other space")
  {
    auto raw = note.into_raw();
    raw.header.space_id = 1234;
    auto on = note_on_event::from_raw(raw);
    REQUIRE_FALSE(on.ok());
    REQUIRE(on.error() == event_error::space_mismatch);
  }

  SECTION("record too small")
  {
    auto raw = note.into_raw();
    raw.header.size = sizeof(clap_event_header);
    auto on = note_on_event::from_raw(raw);
    REQUIRE_FALSE(on.ok());
    REQUIRE(on.error() == event_error::size_mismatch);
  }

  SECTION("matching record")
  {
    auto on = note_on_event::from_raw(note.as_raw().header);
    REQUIRE(on.ok());
    REQUIRE(on.value() == note);
  }
}

TEST_CASE("equality compares payload only", "[events]")
{
  param_mod_event a(0, 5, pckn(0, 0, 60, 1), 0.5);
  REQUIRE(a == a.with_time(100));
  REQUIRE(a == a.with_flags(event_flags_is_live));
  REQUIRE(a != param_mod_event(0, 6, pckn(0, 0, 60, 1), 0.5));
  REQUIRE(a != param_mod_event(0, 5, pckn(0, 0, 61, 1), 0.5));
  REQUIRE(a != param_mod_event(0, 5, pckn(0, 0, 60, 1), 0.75));

  midi_event m(0, 0, { 0x90, 60, 100 });
  REQUIRE(m == midi_event(32, 0, { 0x90, 60, 100 }));
  REQUIRE(m != midi_event(0, 1, { 0x90, 60, 100 }));
  REQUIRE(m != midi_event(0, 0, { 0x80, 60, 100 }));
}

TEST_CASE("builders keep the original intact", "[events]")
{
  note_on_event note(5, pckn(0, 0, 64, 2), 0.4);
  auto louder = note.with_velocity(0.8);
  REQUIRE(note.velocity() == 0.4);
  REQUIRE(louder.velocity() == 0.8);
  REQUIRE(louder.time() == 5);
  REQUIRE(louder.address() == note.address());

  auto live = note.with_flags(event_flags_is_live);
  REQUIRE(live.is_live());
  REQUIRE_FALSE(note.is_live());
}

TEST_CASE("transport fields", "[events]")
{
  auto transport = transport_event(0)
    .with_playing(true)
    .with_tempo(120.0, 0.0)
    .with_time_signature(3, 4);
  REQUIRE(transport.is_playing());
  REQUIRE(transport.has_tempo());
  REQUIRE(transport.has_time_signature());
  REQUIRE(transport.tempo() == 120.0);
  REQUIRE(transport.time_signature_numerator() == 3);
  REQUIRE(transport.time_signature_denominator() == 4);
  REQUIRE_FALSE(transport_event(0).is_playing());
}

TEST_CASE("sysex refers to caller bytes", "[events]")
{
  std::uint8_t bytes[] = { 0xF0, 0x7E, 0x7F, 0x09, 0x01, 0xF7 };
  midi_sysex_event sysex(0, 1, bytes, sizeof(bytes));
  REQUIRE(sysex.buffer() == bytes);
  REQUIRE(sysex.buffer_size() == sizeof(bytes));
  REQUIRE(sysex.port_index() == 1);
}

TEST_CASE("describe names the variant", "[events]")
{
  note_on_event note(10, pckn(0, 1, 60, match32::all()), 0.5);
  auto text = note.describe();
  REQUIRE(text.find("note_on") != std::string::npos);
  REQUIRE(text.find("time: 10") != std::string::npos);
  REQUIRE(text.find("key: 60") != std::string::npos);
  REQUIRE(text.find("note_id: all") != std::string::npos);

  REQUIRE(describe(event_view(note.as_header())) == text);

  clap_event_header opaque = {};
  opaque.size = sizeof(clap_event_header);
  opaque.space_id = 77;
  opaque.type = 3;
  auto opaque_text = describe(event_view(&opaque));
  REQUIRE(opaque_text.find("opaque") != std::string::npos);
  REQUIRE(opaque_text.find("space_id: 77") != std::string::npos);
}

TEST_CASE("view decodes known core records only", "[events]")
{
  param_gesture_begin_event begin(4, 9);
  event_view view(begin.as_header());
  REQUIRE(view.is<param_gesture_begin_event>());
  REQUIRE_FALSE(view.is<param_gesture_end_event>());
  REQUIRE(view.as<param_gesture_begin_event>() == begin);
  REQUIRE_FALSE(view.as<param_gesture_end_event>().has_value());

  auto decoded = view.decode();
  REQUIRE(decoded.has_value());
  REQUIRE(std::holds_alternative<param_gesture_begin_event>(*decoded));

  clap_event_header unknown = {};
  unknown.size = sizeof(clap_event_header);
  unknown.space_id = CLAP_CORE_EVENT_SPACE_ID;
  unknown.type = 200;
  REQUIRE_FALSE(event_view(&unknown).decode().has_value());

  clap_event_header foreign = begin.as_raw().header;
  foreign.space_id = 1;
  REQUIRE_FALSE(event_view(&foreign).decode().has_value());
}
