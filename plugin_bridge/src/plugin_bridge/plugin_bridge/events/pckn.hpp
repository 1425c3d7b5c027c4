#pragma once

#include <plugin_bridge/events/match.hpp>
#include <cstdint>

namespace plugin_bridge {

// Port, channel, key, note id. Addresses a voice, each part may be a wildcard.
// (0, 3, all, all) matches every voice on channel 3 of port 0.
struct pckn final
{
  match16 port = {};
  match16 channel = {};
  match16 key = {};
  match32 note_id = {};

  constexpr pckn() = default;
  constexpr pckn(match16 port, match16 channel, match16 key, match32 note_id) :
  port(port), channel(channel), key(key), note_id(note_id) {}

  static constexpr pckn match_all() { return pckn(); }

  constexpr bool matches(pckn const& other) const
  {
    if (!port.matches(other.port)) return false;
    if (!channel.matches(other.channel)) return false;
    if (!key.matches(other.key)) return false;
    return note_id.matches(other.note_id);
  }

  static constexpr pckn
  from_raw(std::int16_t port, std::int16_t channel, std::int16_t key, std::int32_t note_id)
  {
    return pckn(
      match16::from_raw(port), match16::from_raw(channel),
      match16::from_raw(key), match32::from_raw(note_id));
  }

  constexpr std::int16_t raw_port() const { return port.to_raw(); }
  constexpr std::int16_t raw_channel() const { return channel.to_raw(); }
  constexpr std::int16_t raw_key() const { return key.to_raw(); }
  constexpr std::int32_t raw_note_id() const { return note_id.to_raw(); }

  friend constexpr bool operator==(pckn const& l, pckn const& r)
  { return l.port == r.port && l.channel == r.channel && l.key == r.key && l.note_id == r.note_id; }
  friend constexpr bool operator!=(pckn const& l, pckn const& r)
  { return !(l == r); }
};

}
