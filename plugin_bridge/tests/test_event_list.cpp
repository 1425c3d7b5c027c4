#include <plugin_bridge/events/event_list.hpp>

#include <catch2/catch.hpp>
#include <vector>
#include <cstdint>

using namespace plugin_bridge;

TEST_CASE("buffer keeps submission order", "[event_list]")
{
  event_buffer buffer;
  REQUIRE(buffer.empty());
  REQUIRE(buffer.push(note_on_event(0, pckn(0, 0, 60, 1), 1.0)));
  REQUIRE(buffer.push(param_value_event(4, 2, pckn::match_all(), 0.5)));
  REQUIRE(buffer.push(midi_event(4, 0, { 0x80, 60, 0 })));
  REQUIRE(buffer.push(transport_event(8).with_tempo(90.0, 0.0)));
  REQUIRE(buffer.push(note_off_event(16, pckn(0, 0, 60, 1), 0.0)));
  REQUIRE(buffer.size() == 5);

  auto list = buffer.input();
  REQUIRE(list.size() == 5);
  std::vector<std::uint16_t> types;
  std::vector<std::uint32_t> times;
  for (auto event : list)
  {
    types.push_back(event.type());
    times.push_back(event.time());
  }
  REQUIRE(types == std::vector<std::uint16_t> {
    CLAP_EVENT_NOTE_ON, CLAP_EVENT_PARAM_VALUE, CLAP_EVENT_MIDI, CLAP_EVENT_TRANSPORT, CLAP_EVENT_NOTE_OFF });
  REQUIRE(times == std::vector<std::uint32_t> { 0, 4, 4, 8, 16 });

  // iteration restarts from the first record
  REQUIRE((*list.begin()).type() == CLAP_EVENT_NOTE_ON);
}

TEST_CASE("note survives the raw list", "[event_list]")
{
  event_buffer buffer;
  note_on_event note(10, pckn(0, 1, 60, 7), 0.8);
  REQUIRE(buffer.push(note));

  auto raw = buffer.as_input();
  REQUIRE(raw->size(raw) == 1);
  auto header = raw->get(raw, 0);
  REQUIRE(header != nullptr);
  REQUIRE(header->size == sizeof(clap_event_note));
  REQUIRE(reinterpret_cast<std::uintptr_t>(header) % alignof(clap_event_note) == 0);

  auto decoded = event_view(header).as<note_on_event>();
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->time() == 10);
  REQUIRE(decoded->port() == match16::specific(0));
  REQUIRE(decoded->channel() == match16::specific(1));
  REQUIRE(decoded->key() == match16::specific(60));
  REQUIRE(decoded->note_id() == match32::specific(7));
  REQUIRE(decoded->velocity() == 0.8);
}

TEST_CASE("out of range reads are null", "[event_list]")
{
  event_buffer buffer;
  REQUIRE(buffer.get(0) == nullptr);
  REQUIRE_FALSE(buffer.input().get(0).has_value());
  REQUIRE(buffer.push(param_gesture_end_event(0, 1)));
  REQUIRE(buffer.input().get(0).has_value());
  REQUIRE_FALSE(buffer.input().get(1).has_value());
}

TEST_CASE("malformed records are refused", "[event_list]")
{
  event_buffer buffer;
  REQUIRE_FALSE(buffer.push(static_cast<clap_event_header const*>(nullptr)));

  clap_event_header tiny = {};
  tiny.size = sizeof(clap_event_header) - 1;
  REQUIRE_FALSE(buffer.push(&tiny));

  std::vector<std::uint64_t> storage(event_buffer::max_event_size / sizeof(std::uint64_t) + 2, 0);
  auto huge = reinterpret_cast<clap_event_header*>(storage.data());
  huge->size = event_buffer::max_event_size + 8;
  REQUIRE_FALSE(buffer.push(huge));
  REQUIRE(buffer.empty());

  // header only records of foreign spaces are fine
  clap_event_header foreign = {};
  foreign.size = sizeof(clap_event_header);
  foreign.space_id = 42;
  REQUIRE(buffer.push(&foreign));
  REQUIRE(buffer.size() == 1);
}

TEST_CASE("output list appends through the raw table", "[event_list]")
{
  event_buffer buffer;
  auto out = buffer.output();
  REQUIRE(out.try_push(note_choke_event(3, pckn(0, match16::all(), 60, match32::all()), 0.0)));
  REQUIRE(out.try_push(midi2_event(5, 0, { 1, 2, 3, 4 })));
  REQUIRE(buffer.size() == 2);
  REQUIRE(event_view(buffer.get(1)).as<midi2_event>()->data()[3] == 4);

  buffer.clear();
  REQUIRE(buffer.empty());
  REQUIRE(buffer.input().empty());
}

TEST_CASE("unknown records decode to nothing", "[event_list]")
{
  event_buffer buffer;
  clap_event_header unknown = {};
  unknown.size = sizeof(clap_event_header);
  unknown.space_id = CLAP_CORE_EVENT_SPACE_ID;
  unknown.type = 999;
  REQUIRE(buffer.push(&unknown));
  REQUIRE(buffer.push(note_end_event(1, pckn(0, 0, 60, 1), 0.0)));

  int decoded = 0;
  for (auto event : buffer.input())
    if (event.decode()) decoded++;
  REQUIRE(decoded == 1);
}

namespace {

// four slots, the second and last answer null
struct holey_list
{
  clap_input_events raw = {};
  note_on_event first = note_on_event(1, pckn(0, 0, 60, 1), 1.0);
  note_off_event third = note_off_event(3, pckn(0, 0, 60, 1), 0.0);

  static std::uint32_t CLAP_ABI size(clap_input_events const* list) { return 4; }
  static clap_event_header const* CLAP_ABI get(clap_input_events const* list, std::uint32_t index)
  {
    auto self = static_cast<holey_list const*>(list->ctx);
    if (index == 0) return self->first.as_header();
    if (index == 2) return self->third.as_header();
    return nullptr;
  }

  holey_list()
  {
    raw.ctx = this;
    raw.size = size;
    raw.get = get;
  }
};

}

TEST_CASE("null records from a peer are skipped", "[event_list]")
{
  holey_list holey;
  input_event_list list(&holey.raw);
  REQUIRE(list.size() == 4);
  REQUIRE_FALSE(list.get(1).has_value());
  REQUIRE_FALSE(list.get(3).has_value());
  REQUIRE(list.get(2).has_value());

  std::vector<std::uint32_t> times;
  for (auto event : list)
    times.push_back(event.time());
  REQUIRE(times == std::vector<std::uint32_t> { 1, 3 });
}

TEST_CASE("all null records iterate as empty", "[event_list]")
{
  clap_input_events raw = {};
  raw.size = [](clap_input_events const*) -> std::uint32_t { return 2; };
  raw.get = [](clap_input_events const*, std::uint32_t) -> clap_event_header const* { return nullptr; };
  input_event_list list(&raw);
  REQUIRE(list.begin() == list.end());
}
