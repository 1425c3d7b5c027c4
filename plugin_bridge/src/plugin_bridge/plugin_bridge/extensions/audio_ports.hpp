#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/threading/handles.hpp>

#include <clap/ext/audio-ports.h>

#include <string>
#include <cstdint>
#include <optional>

namespace plugin_bridge {

// port_type is CLAP_PORT_MONO, CLAP_PORT_STEREO, another static string or null
struct audio_port_info
{
  clap_id id;
  std::string name;
  std::uint32_t flags;
  std::uint32_t channel_count;
  char const* port_type;
  std::optional<clap_id> in_place_pair;

  bool is_main() const { return (flags & CLAP_AUDIO_PORT_IS_MAIN) != 0; }
};

class plugin_audio_ports final:
public extension<clap_plugin_audio_ports>
{
public:
  static char const* id() { return CLAP_EXT_AUDIO_PORTS; }
  explicit plugin_audio_ports(clap_plugin_audio_ports const* table) : extension(table) {}

  std::uint32_t count(plugin_main_thread_handle const& plugin, bool is_input) const;
  std::optional<audio_port_info> get(plugin_main_thread_handle const& plugin, std::uint32_t index, bool is_input) const;
};

class plugin_audio_ports_impl {
public:
  virtual ~plugin_audio_ports_impl() = default;
  virtual std::uint32_t count(host_main_thread_handle const& host, bool is_input) = 0;
  virtual std::optional<audio_port_info> get(host_main_thread_handle const& host, std::uint32_t index, bool is_input) = 0;

  static char const* extension_id() { return CLAP_EXT_AUDIO_PORTS; }

  // answered by the plugin wrapper's clap-helpers table
  static clap_plugin_audio_ports const* extension_table() { return nullptr; }
};

void to_raw(audio_port_info const& info, clap_audio_port_info& raw);

}
