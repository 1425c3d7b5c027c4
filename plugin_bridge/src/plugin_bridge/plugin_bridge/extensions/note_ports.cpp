#include <plugin_bridge/extensions/note_ports.hpp>

namespace plugin_bridge {

std::uint32_t
plugin_note_ports::count(plugin_main_thread_handle const& plugin, bool is_input) const
{
  if (_table->count == nullptr) return 0;
  return _table->count(plugin.as_raw(), is_input);
}

std::optional<note_port_info>
plugin_note_ports::get(plugin_main_thread_handle const& plugin, std::uint32_t index, bool is_input) const
{
  if (_table->get == nullptr) return std::nullopt;
  clap_note_port_info raw = {};
  if (!_table->get(plugin.as_raw(), index, is_input, &raw)) return std::nullopt;
  raw.name[CLAP_NAME_SIZE - 1] = '\0';
  return note_port_info { raw.id, raw.supported_dialects, static_cast<note_dialect>(raw.preferred_dialect), raw.name };
}

void
to_raw(note_port_info const& info, clap_note_port_info& raw)
{
  raw = {};
  raw.id = info.id;
  raw.supported_dialects = info.supported_dialects;
  raw.preferred_dialect = info.preferred_dialect;
  from_8bit_string(raw.name, info.name.c_str());
}

}
