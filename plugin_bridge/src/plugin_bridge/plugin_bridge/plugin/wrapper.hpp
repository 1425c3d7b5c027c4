#pragma once

#include <plugin_bridge/plugin/plugin.hpp>
#include <plugin_bridge/plugin/host_proxy.hpp>
#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/extensions/gui.hpp>
#include <plugin_bridge/extensions/params.hpp>
#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/extensions/note_ports.hpp>
#include <plugin_bridge/extensions/audio_ports.hpp>

#include <clap/plugin.h>
#include <clap/helpers/plugin.hh>

#include <memory>
#include <cstdint>

namespace plugin_bridge {

// One clap-helpers plugin per instance. clap-helpers owns the clap_plugin,
// its tables and the lifecycle and thread checks for H and L. The overrides
// mint handles and forward to the plugin and its declared extensions.
// Deleted by the clap-helpers destroy trampoline.
template <misbehaviour_handler H, checking_level L>
class plugin_wrapper final:
public ::clap::helpers::Plugin<H, L>
{
  typedef ::clap::helpers::Plugin<H, L> base;

  mutable helpers_host_proxy<H, L> _proxy;
  std::unique_ptr<plugin> _instance;
  extension_declarations _extensions = {};

  // our log first, clap-helpers may terminate
  void report(char const* func, char const* message);

  template <class Impl> Impl*
  find_impl() const { return _extensions.template find_impl<Impl>(); }

  template <class Impl, class R, class F> R
  call_main(char const* func, R failure, F&& f) const noexcept;
  template <class Impl, class F> void
  call_main_void(char const* func, F&& f) const noexcept;

public:
  PBRIDGE_PIN_ADDRESS(plugin_wrapper);
  plugin_wrapper(
    clap_plugin_descriptor const* desc, clap_host const* host,
    std::unique_ptr<plugin> plugin);

  bool init() noexcept override;
  bool activate(double sample_rate, std::uint32_t min_frame_count, std::uint32_t max_frame_count) noexcept override;
  void deactivate() noexcept override;
  bool startProcessing() noexcept override;
  void stopProcessing() noexcept override;
  void reset() noexcept override;
  clap_process_status process(clap_process const* process) noexcept override;
  void onMainThread() noexcept override;
  void const* extension(char const* id) noexcept override;

  bool implementsParams() const noexcept override { return find_impl<plugin_params_impl>() != nullptr; }
  std::uint32_t paramsCount() const noexcept override;
  bool paramsInfo(std::uint32_t index, clap_param_info* info) const noexcept override;
  bool paramsValue(clap_id param_id, double* value) noexcept override;
  bool paramsValueToText(clap_id param_id, double value, char* display, std::uint32_t size) noexcept override;
  bool paramsTextToValue(clap_id param_id, char const* display, double* value) noexcept override;
  void paramsFlush(clap_input_events const* in, clap_output_events const* out) noexcept override;

  bool implementsAudioPorts() const noexcept override { return find_impl<plugin_audio_ports_impl>() != nullptr; }
  std::uint32_t audioPortsCount(bool is_input) const noexcept override;
  bool audioPortsInfo(std::uint32_t index, bool is_input, clap_audio_port_info* info) const noexcept override;

  bool implementsNotePorts() const noexcept override { return find_impl<plugin_note_ports_impl>() != nullptr; }
  std::uint32_t notePortsCount(bool is_input) const noexcept override;
  bool notePortsInfo(std::uint32_t index, bool is_input, clap_note_port_info* info) const noexcept override;

  bool implementsGui() const noexcept override { return find_impl<plugin_gui_impl>() != nullptr; }
  bool guiIsApiSupported(char const* api, bool is_floating) noexcept override;
  bool guiGetPreferredApi(char const** api, bool* is_floating) noexcept override;
  bool guiCreate(char const* api, bool is_floating) noexcept override;
  void guiDestroy() noexcept override;
  bool guiSetScale(double scale) noexcept override;
  bool guiGetSize(std::uint32_t* width, std::uint32_t* height) noexcept override;
  bool guiCanResize() const noexcept override;
  bool guiGetResizeHints(clap_gui_resize_hints_t* hints) noexcept override;
  bool guiAdjustSize(std::uint32_t* width, std::uint32_t* height) noexcept override;
  bool guiSetSize(std::uint32_t width, std::uint32_t height) noexcept override;
  bool guiSetParent(clap_window const* window) noexcept override;
  bool guiSetTransient(clap_window const* window) noexcept override;
  void guiSuggestTitle(char const* title) noexcept override;
  bool guiShow() noexcept override;
  bool guiHide() noexcept override;
};

// New instance with the clap-helpers checking matching config.
// The returned plugin owns the wrapper until the host destroys it.
clap_plugin const*
create_plugin_wrapper(
  clap_plugin_descriptor const* desc, clap_host const* host,
  std::unique_ptr<plugin> plugin, bridge_config const& config);

}
