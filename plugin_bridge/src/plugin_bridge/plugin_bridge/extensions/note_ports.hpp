#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/threading/handles.hpp>

#include <clap/ext/note-ports.h>

#include <string>
#include <cstdint>
#include <optional>

namespace plugin_bridge {

enum note_dialect : std::uint32_t {
  note_dialect_clap = CLAP_NOTE_DIALECT_CLAP,
  note_dialect_midi = CLAP_NOTE_DIALECT_MIDI,
  note_dialect_midi_mpe = CLAP_NOTE_DIALECT_MIDI_MPE,
  note_dialect_midi2 = CLAP_NOTE_DIALECT_MIDI2 };

struct note_port_info
{
  clap_id id;
  std::uint32_t supported_dialects;
  note_dialect preferred_dialect;
  std::string name;

  bool supports(note_dialect dialect) const { return (supported_dialects & dialect) != 0; }
};

class plugin_note_ports final:
public extension<clap_plugin_note_ports>
{
public:
  static char const* id() { return CLAP_EXT_NOTE_PORTS; }
  explicit plugin_note_ports(clap_plugin_note_ports const* table) : extension(table) {}

  std::uint32_t count(plugin_main_thread_handle const& plugin, bool is_input) const;
  std::optional<note_port_info> get(plugin_main_thread_handle const& plugin, std::uint32_t index, bool is_input) const;
};

class plugin_note_ports_impl {
public:
  virtual ~plugin_note_ports_impl() = default;
  virtual std::uint32_t count(host_main_thread_handle const& host, bool is_input) = 0;
  virtual std::optional<note_port_info> get(host_main_thread_handle const& host, std::uint32_t index, bool is_input) = 0;

  static char const* extension_id() { return CLAP_EXT_NOTE_PORTS; }

  // answered by the plugin wrapper's clap-helpers table
  static clap_plugin_note_ports const* extension_table() { return nullptr; }
};

void to_raw(note_port_info const& info, clap_note_port_info& raw);

}
