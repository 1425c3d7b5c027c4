#pragma once

#include <plugin_bridge/shared/result.hpp>
#include <plugin_bridge/plugin/host_proxy.hpp>
#include <plugin_bridge/plugin/process_context.hpp>
#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/extensions/extension.hpp>

#include <cstdint>

namespace plugin_bridge {

enum class plugin_error { init, activate, start_processing, process };
char const* plugin_error_text(plugin_error error);

struct audio_configuration
{
  double sample_rate;
  std::uint32_t min_frames_count;
  std::uint32_t max_frames_count;
};

// Plugin side implementation of one instance.
// Lifecycle ordering is enforced by the wrapper, not here.
class plugin {
public:
  virtual ~plugin() = default;

  // main thread
  virtual status<plugin_error> init(host_main_thread_handle const& host) { return {}; }
  virtual void declare_extensions(extension_declarations& declarations) {}
  virtual status<plugin_error> activate(host_main_thread_handle const& host, audio_configuration const& config) { return {}; }
  virtual void deactivate(host_main_thread_handle const& host) {}
  virtual void on_main_thread(host_main_thread_handle const& host) {}

  // audio thread
  virtual status<plugin_error> start_processing(host_audio_thread_handle const& host) { return {}; }
  virtual void stop_processing(host_audio_thread_handle const& host) {}
  virtual void reset(host_audio_thread_handle const& host) {}
  virtual result<process_status, plugin_error> process(host_audio_thread_handle const& host, process_context const& context) = 0;
};

}
