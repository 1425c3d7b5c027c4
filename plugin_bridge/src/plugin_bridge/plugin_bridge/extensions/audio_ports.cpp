#include <plugin_bridge/extensions/audio_ports.hpp>

namespace plugin_bridge {

std::uint32_t
plugin_audio_ports::count(plugin_main_thread_handle const& plugin, bool is_input) const
{
  if (_table->count == nullptr) return 0;
  return _table->count(plugin.as_raw(), is_input);
}

std::optional<audio_port_info>
plugin_audio_ports::get(plugin_main_thread_handle const& plugin, std::uint32_t index, bool is_input) const
{
  if (_table->get == nullptr) return std::nullopt;
  clap_audio_port_info raw = {};
  if (!_table->get(plugin.as_raw(), index, is_input, &raw)) return std::nullopt;
  raw.name[CLAP_NAME_SIZE - 1] = '\0';
  std::optional<clap_id> pair = {};
  if (raw.in_place_pair != CLAP_INVALID_ID) pair = raw.in_place_pair;
  return audio_port_info { raw.id, raw.name, raw.flags, raw.channel_count, raw.port_type, pair };
}

void
to_raw(audio_port_info const& info, clap_audio_port_info& raw)
{
  raw = {};
  raw.id = info.id;
  from_8bit_string(raw.name, info.name.c_str());
  raw.flags = info.flags;
  raw.channel_count = info.channel_count;
  raw.port_type = info.port_type;
  raw.in_place_pair = info.in_place_pair.value_or(CLAP_INVALID_ID);
}

}
