#pragma once

#include <plugin_bridge/plugin/plugin.hpp>
#include <plugin_bridge/plugin/registry.hpp>
#include <plugin_bridge/extensions/log.hpp>
#include <plugin_bridge/extensions/params.hpp>
#include <plugin_bridge/extensions/audio_ports.hpp>
#include <plugin_bridge/extensions/note_ports.hpp>

#include <readerwriterqueue.h>

#include <memory>
#include <string>
#include <cstdint>
#include <optional>

#define GAIN_PLUGIN_ID "org.plugin-bridge.gain"
#define GAIN_PLUGIN_FULL_NAME "Plugin Bridge Gain"
#define GAIN_PLUGIN_VENDOR_NAME "Plugin Bridge"
#define GAIN_PLUGIN_VENDOR_URL "https://github.com/plugin-bridge/plugin-bridge"
#define GAIN_PLUGIN_VERSION_MAJOR 1
#define GAIN_PLUGIN_VERSION_MINOR 0
#define GAIN_PLUGIN_VERSION_PATCH 0
#define GAIN_PLUGIN_VERSION_TEXT PBRIDGE_VERSION_TEXT(GAIN_PLUGIN_VERSION_MAJOR, GAIN_PLUGIN_VERSION_MINOR, GAIN_PLUGIN_VERSION_PATCH)

namespace gain_plugin {

inline clap_id constexpr gain_param_id = 0;
inline double constexpr gain_min = 0.0;
inline double constexpr gain_max = 1000.0;
inline double constexpr gain_default = 1.0;
inline int constexpr gain_queue_size = 1024;

// count and get clash with the audio port signatures
class gain_note_ports final:
public plugin_bridge::plugin_note_ports_impl
{
public:
  std::uint32_t count(plugin_bridge::host_main_thread_handle const& host, bool is_input) override { return is_input ? 1 : 0; }
  std::optional<plugin_bridge::note_port_info> get(plugin_bridge::host_main_thread_handle const& host, std::uint32_t index, bool is_input) override;
};

// Multiplies stereo audio by a stepped gain and doubles note on velocities.
class gain final:
public plugin_bridge::plugin,
public plugin_bridge::plugin_params_impl,
public plugin_bridge::plugin_audio_ports_impl
{
  typedef moodycamel::ReaderWriterQueue<double, gain_queue_size> gain_queue;

  double _main_gain = gain_default;
  double _audio_gain = gain_default;
  bool _processing = false;
  gain_note_ports _note_ports = {};
  std::unique_ptr<gain_queue> _to_main = {};
  std::optional<plugin_bridge::host_log> _log = {};

  bool apply_param_event(plugin_bridge::event_view const& event);
  void push_to_main(plugin_bridge::host_handle const& host, double gain);

public:
  gain();

  plugin_bridge::status<plugin_bridge::plugin_error> init(plugin_bridge::host_main_thread_handle const& host) override;
  void declare_extensions(plugin_bridge::extension_declarations& declarations) override;
  plugin_bridge::status<plugin_bridge::plugin_error> activate(
    plugin_bridge::host_main_thread_handle const& host,
    plugin_bridge::audio_configuration const& config) override;
  void on_main_thread(plugin_bridge::host_main_thread_handle const& host) override;

  plugin_bridge::status<plugin_bridge::plugin_error> start_processing(plugin_bridge::host_audio_thread_handle const& host) override;
  void stop_processing(plugin_bridge::host_audio_thread_handle const& host) override { _processing = false; }
  plugin_bridge::result<plugin_bridge::process_status, plugin_bridge::plugin_error> process(
    plugin_bridge::host_audio_thread_handle const& host,
    plugin_bridge::process_context const& context) override;

  std::uint32_t count(plugin_bridge::host_main_thread_handle const& host) override { return 1; }
  std::optional<plugin_bridge::param_info> get_info(plugin_bridge::host_main_thread_handle const& host, std::uint32_t index) override;
  std::optional<double> get_value(plugin_bridge::host_main_thread_handle const& host, clap_id param_id) override;
  std::optional<std::string> value_to_text(plugin_bridge::host_main_thread_handle const& host, clap_id param_id, double value) override;
  std::optional<double> text_to_value(plugin_bridge::host_main_thread_handle const& host, clap_id param_id, std::string_view text) override;
  void flush(plugin_bridge::host_handle const& host, plugin_bridge::input_event_list const& in, plugin_bridge::output_event_list const& out) override;

  std::uint32_t count(plugin_bridge::host_main_thread_handle const& host, bool is_input) override;
  std::optional<plugin_bridge::audio_port_info> get(plugin_bridge::host_main_thread_handle const& host, std::uint32_t index, bool is_input) override;
};

plugin_bridge::plugin_descriptor_info gain_descriptor();
bool register_gain_plugin(plugin_bridge::plugin_registry& registry);

}
