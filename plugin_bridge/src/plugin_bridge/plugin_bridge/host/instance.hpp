#pragma once

#include <plugin_bridge/host/host.hpp>
#include <plugin_bridge/host/bundle.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>
#include <plugin_bridge/host/audio_buffers.hpp>
#include <plugin_bridge/plugin/plugin.hpp>
#include <plugin_bridge/events/event_list.hpp>
#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/shared/result.hpp>
#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/extensions/extension.hpp>

#include <clap/plugin.h>
#include <clap/factory/plugin-factory.h>

#include <memory>
#include <thread>
#include <cstdint>
#include <optional>

namespace plugin_bridge {

enum class instance_error {
  plugin_not_found, creation_failed, init_failed,
  activation_failed, already_activated, not_activated,
  start_processing_failed, not_processing, process_failed };
char const* instance_error_text(instance_error error);

// Host side owner of one plugin instance, from create to destroy.
// Main thread unless stated otherwise.
class plugin_instance final {
  host_wrapper _host;
  bridge_config const _config;
  clap_plugin const* _plugin = nullptr;
  extension_cache _extensions = {};
  std::thread::id const _main_thread;
  std::optional<std::thread::id> _audio_thread = {};
  bool _active = false;
  bool _processing = false;

  plugin_instance(host& host, host_info const& info, bridge_config const& config);
  void check_main_thread(char const* func) const;
  void check_audio_thread(char const* func) const;

public:
  PBRIDGE_PIN_ADDRESS(plugin_instance);
  ~plugin_instance();

  // looks the id up, creates and initializes
  static result<std::unique_ptr<plugin_instance>, instance_error>
  create(host& host, host_info const& info, clap_plugin_factory const* factory,
    char const* plugin_id, bridge_config const& config = {});
  static result<std::unique_ptr<plugin_instance>, instance_error>
  create(host& host, host_info const& info, plugin_bundle const& bundle,
    char const* plugin_id, bridge_config const& config = {});

  clap_plugin const* as_raw() const { return _plugin; }
  clap_plugin_descriptor const* descriptor() const { return _plugin->desc; }
  host_wrapper const& host_side() const { return _host; }
  bool is_active() const { return _active; }
  bool is_processing() const { return _processing; }

  status<instance_error> activate(audio_configuration const& config);
  status<instance_error> deactivate();
  void on_main_thread();

  // queried once per id, absent forever after a null answer
  template <class Ext> std::optional<Ext> extension();

  // audio thread
  status<instance_error> start_processing();
  status<instance_error> stop_processing();
  status<instance_error> reset();
  result<process_status, instance_error> process(
    audio_port_buffers& inputs, audio_port_buffers& outputs,
    event_buffer const& in_events, event_buffer& out_events,
    std::uint32_t frames_count, std::int64_t steady_time = -1,
    transport_event const* transport = nullptr);

  // f receives a handle valid only for the duration of the call
  template <class F> decltype(auto) main_thread(F&& f);
  template <class F> decltype(auto) audio_thread(F&& f);
};

template <class Ext> std::optional<Ext>
plugin_instance::extension()
{
  check_main_thread(__func__);
  return _extensions.template negotiate<Ext>([this](char const* id) -> void const* {
    if (_plugin->get_extension == nullptr) return nullptr;
    return _plugin->get_extension(_plugin, id);
  });
}

template <class F> decltype(auto)
plugin_instance::main_thread(F&& f)
{
  check_main_thread(__func__);
  plugin_main_thread_handle handle(_plugin);
  return f(static_cast<plugin_main_thread_handle const&>(handle));
}

template <class F> decltype(auto)
plugin_instance::audio_thread(F&& f)
{
  check_audio_thread(__func__);
  plugin_audio_thread_handle handle(_plugin);
  return f(static_cast<plugin_audio_thread_handle const&>(handle));
}

}
