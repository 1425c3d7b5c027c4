#include <plugin_bridge/plugin/wrapper.hpp>
#include <plugin_bridge/shared/logger.hpp>
#include <plugin_bridge/shared/boundary.hpp>

#include <clap/helpers/plugin.hxx>
#include <clap/helpers/host-proxy.hxx>

#include <string>
#include <utility>

namespace plugin_bridge {

template <misbehaviour_handler H, checking_level L>
plugin_wrapper<H, L>::
plugin_wrapper(
  clap_plugin_descriptor const* desc, clap_host const* host,
  std::unique_ptr<plugin> plugin):
base(desc, host), _proxy(this->_host), _instance(std::move(plugin))
{ assert(_instance); }

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::report(char const* func, char const* message)
{
  write_log(log_level::misbehaving, __FILE__, __LINE__, func, message);
  this->hostMisbehaving(message);
}

template <misbehaviour_handler H, checking_level L>
template <class Impl, class R, class F> R
plugin_wrapper<H, L>::call_main(char const* func, R failure, F&& f) const noexcept
{
  return guard_boundary(func, failure, [&]() -> R {
    auto impl = find_impl<Impl>();
    if (impl == nullptr) return failure;
    host_main_thread_handle handle(&_proxy);
    return f(*impl, handle);
  });
}

template <misbehaviour_handler H, checking_level L>
template <class Impl, class F> void
plugin_wrapper<H, L>::call_main_void(char const* func, F&& f) const noexcept
{
  guard_boundary_void(func, [&]() {
    auto impl = find_impl<Impl>();
    if (impl == nullptr) return;
    host_main_thread_handle handle(&_proxy);
    f(*impl, handle);
  });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::init() noexcept
{
  return guard_boundary(__func__, false, [this]() {
    host_main_thread_handle handle(&_proxy);
    auto status = _instance->init(handle);
    if (!status.ok())
    {
      PBRIDGE_WRITE_LOG_AT(error, plugin_error_text(status.error()));
      return false;
    }
    _instance->declare_extensions(_extensions);
    return true;
  });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::activate(double sample_rate, std::uint32_t min_frame_count, std::uint32_t max_frame_count) noexcept
{
  auto func = __func__;
  return guard_boundary(func, false, [this, func, sample_rate, min_frame_count, max_frame_count]() {
    if constexpr (L != checking_level::None)
      if (!(sample_rate > 0) || min_frame_count > max_frame_count)
      {
        report(func, "Activate called with invalid audio configuration.");
        return false;
      }

    host_main_thread_handle handle(&_proxy);
    audio_configuration config = { sample_rate, min_frame_count, max_frame_count };
    auto status = _instance->activate(handle, config);
    if (!status.ok())
    {
      PBRIDGE_WRITE_LOG_AT(error, plugin_error_text(status.error()));
      return false;
    }
    return true;
  });
}

// clap-helpers deactivates on destroy without stopping first
template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::deactivate() noexcept
{
  guard_boundary_void(__func__, [this]() {
    if (this->isProcessing())
    {
      host_audio_thread_handle audio(&_proxy);
      _instance->stop_processing(audio);
    }
    host_main_thread_handle handle(&_proxy);
    _instance->deactivate(handle);
  });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::startProcessing() noexcept
{
  return guard_boundary(__func__, false, [this]() {
    host_audio_thread_handle handle(&_proxy);
    auto status = _instance->start_processing(handle);
    if (!status.ok())
    {
      PBRIDGE_WRITE_LOG_AT(error, plugin_error_text(status.error()));
      return false;
    }
    return true;
  });
}

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::stopProcessing() noexcept
{
  guard_boundary_void(__func__, [this]() {
    host_audio_thread_handle handle(&_proxy);
    _instance->stop_processing(handle);
  });
}

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::reset() noexcept
{
  guard_boundary_void(__func__, [this]() {
    host_audio_thread_handle handle(&_proxy);
    _instance->reset(handle);
  });
}

template <misbehaviour_handler H, checking_level L> clap_process_status
plugin_wrapper<H, L>::process(clap_process const* process) noexcept
{
  auto func = __func__;
  clap_process_status failure = CLAP_PROCESS_ERROR;
  return guard_boundary(func, failure, [this, process, func, failure]() {
    if (process == nullptr || process->in_events == nullptr || process->out_events == nullptr)
    {
      report(func, "Process called without process data or event lists.");
      return failure;
    }

    process_context context(process);
    host_audio_thread_handle handle(&_proxy);
    auto result = _instance->process(handle, context);
    if (!result.ok()) return failure;
    return static_cast<clap_process_status>(result.value());
  });
}

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::onMainThread() noexcept
{
  guard_boundary_void(__func__, [this]() {
    host_main_thread_handle handle(&_proxy);
    _instance->on_main_thread(handle);
  });
}

// clap-helpers answers the extensions it implements itself first
template <misbehaviour_handler H, checking_level L> void const*
plugin_wrapper<H, L>::extension(char const* id) noexcept
{
  return guard_boundary(__func__, static_cast<void const*>(nullptr),
    [this, id]() { return _extensions.find_table(id); });
}

template <misbehaviour_handler H, checking_level L> std::uint32_t
plugin_wrapper<H, L>::paramsCount() const noexcept
{
  return call_main<plugin_params_impl>(__func__, 0u,
    [](plugin_params_impl& impl, host_main_thread_handle const& host) { return impl.count(host); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::paramsInfo(std::uint32_t index, clap_param_info* info) const noexcept
{
  return call_main<plugin_params_impl>(__func__, false,
    [=](plugin_params_impl& impl, host_main_thread_handle const& host) {
      if (info == nullptr) return false;
      auto result = impl.get_info(host, index);
      if (!result) return false;
      to_raw(*result, *info);
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::paramsValue(clap_id param_id, double* value) noexcept
{
  return call_main<plugin_params_impl>(__func__, false,
    [=](plugin_params_impl& impl, host_main_thread_handle const& host) {
      if (value == nullptr) return false;
      auto result = impl.get_value(host, param_id);
      if (!result) return false;
      *value = *result;
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::paramsValueToText(clap_id param_id, double value, char* display, std::uint32_t size) noexcept
{
  return call_main<plugin_params_impl>(__func__, false,
    [=](plugin_params_impl& impl, host_main_thread_handle const& host) {
      if (display == nullptr || size == 0) return false;
      auto text = impl.value_to_text(host, param_id, value);
      if (!text || has_embedded_nul(*text)) return false;
      from_8bit_string(display, size, text->c_str());
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::paramsTextToValue(clap_id param_id, char const* display, double* value) noexcept
{
  return call_main<plugin_params_impl>(__func__, false,
    [=](plugin_params_impl& impl, host_main_thread_handle const& host) {
      if (display == nullptr || value == nullptr) return false;
      auto result = impl.text_to_value(host, param_id, display);
      if (!result) return false;
      *value = *result;
      return true;
    });
}

// audio thread while active, main thread otherwise
template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::paramsFlush(clap_input_events const* in, clap_output_events const* out) noexcept
{
  guard_boundary_void(__func__, [this, in, out]() {
    auto impl = find_impl<plugin_params_impl>();
    if (impl == nullptr || in == nullptr || out == nullptr) return;
    host_handle handle(&_proxy);
    impl->flush(handle, input_event_list(in), output_event_list(out));
  });
}

template <misbehaviour_handler H, checking_level L> std::uint32_t
plugin_wrapper<H, L>::audioPortsCount(bool is_input) const noexcept
{
  return call_main<plugin_audio_ports_impl>(__func__, 0u,
    [=](plugin_audio_ports_impl& impl, host_main_thread_handle const& host) { return impl.count(host, is_input); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::audioPortsInfo(std::uint32_t index, bool is_input, clap_audio_port_info* info) const noexcept
{
  return call_main<plugin_audio_ports_impl>(__func__, false,
    [=](plugin_audio_ports_impl& impl, host_main_thread_handle const& host) {
      if (info == nullptr) return false;
      auto result = impl.get(host, index, is_input);
      if (!result) return false;
      to_raw(*result, *info);
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> std::uint32_t
plugin_wrapper<H, L>::notePortsCount(bool is_input) const noexcept
{
  return call_main<plugin_note_ports_impl>(__func__, 0u,
    [=](plugin_note_ports_impl& impl, host_main_thread_handle const& host) { return impl.count(host, is_input); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::notePortsInfo(std::uint32_t index, bool is_input, clap_note_port_info* info) const noexcept
{
  return call_main<plugin_note_ports_impl>(__func__, false,
    [=](plugin_note_ports_impl& impl, host_main_thread_handle const& host) {
      if (info == nullptr) return false;
      auto result = impl.get(host, index, is_input);
      if (!result) return false;
      to_raw(*result, *info);
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiIsApiSupported(char const* api, bool is_floating) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (api == nullptr) return false;
      return impl.is_api_supported(host, { api, is_floating });
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiGetPreferredApi(char const** api, bool* is_floating) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (api == nullptr || is_floating == nullptr) return false;
      auto preferred = impl.get_preferred_api(host);
      if (!preferred) return false;
      *api = preferred->api;
      *is_floating = preferred->is_floating;
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiCreate(char const* api, bool is_floating) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (api == nullptr) return false;
      return impl.create(host, { api, is_floating }).ok();
    });
}

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::guiDestroy() noexcept
{
  call_main_void<plugin_gui_impl>(__func__,
    [](plugin_gui_impl& impl, host_main_thread_handle const& host) { impl.destroy(host); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiSetScale(double scale) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) { return impl.set_scale(host, scale).ok(); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiGetSize(std::uint32_t* width, std::uint32_t* height) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (width == nullptr || height == nullptr) return false;
      auto size = impl.get_size(host);
      if (!size) return false;
      *width = size->width;
      *height = size->height;
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiCanResize() const noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [](plugin_gui_impl& impl, host_main_thread_handle const& host) { return impl.can_resize(host); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiGetResizeHints(clap_gui_resize_hints_t* hints) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (hints == nullptr) return false;
      auto result = impl.get_resize_hints(host);
      if (!result) return false;
      to_raw(*result, *hints);
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiAdjustSize(std::uint32_t* width, std::uint32_t* height) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (width == nullptr || height == nullptr) return false;
      auto adjusted = impl.adjust_size(host, { *width, *height });
      if (!adjusted) return false;
      *width = adjusted->width;
      *height = adjusted->height;
      return true;
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiSetSize(std::uint32_t width, std::uint32_t height) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) { return impl.set_size(host, { width, height }).ok(); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiSetParent(clap_window const* window) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (window == nullptr) return false;
      return impl.set_parent(host, gui_window(*window)).ok();
    });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiSetTransient(clap_window const* window) noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) {
      if (window == nullptr) return false;
      return impl.set_transient(host, gui_window(*window)).ok();
    });
}

template <misbehaviour_handler H, checking_level L> void
plugin_wrapper<H, L>::guiSuggestTitle(char const* title) noexcept
{
  call_main_void<plugin_gui_impl>(__func__,
    [=](plugin_gui_impl& impl, host_main_thread_handle const& host) { impl.suggest_title(host, to_8bit_string(title)); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiShow() noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [](plugin_gui_impl& impl, host_main_thread_handle const& host) { return impl.show(host).ok(); });
}

template <misbehaviour_handler H, checking_level L> bool
plugin_wrapper<H, L>::guiHide() noexcept
{
  return call_main<plugin_gui_impl>(__func__, false,
    [](plugin_gui_impl& impl, host_main_thread_handle const& host) { return impl.hide(host).ok(); });
}

template <misbehaviour_handler H> static clap_plugin const*
create_checked(
  checking_level checking, clap_plugin_descriptor const* desc,
  clap_host const* host, std::unique_ptr<plugin> plugin)
{
  switch (checking)
  {
  case checking_level::None:
    return (new plugin_wrapper<H, checking_level::None>(desc, host, std::move(plugin)))->clapPlugin();
  case checking_level::Minimal:
    return (new plugin_wrapper<H, checking_level::Minimal>(desc, host, std::move(plugin)))->clapPlugin();
  case checking_level::Maximal:
    return (new plugin_wrapper<H, checking_level::Maximal>(desc, host, std::move(plugin)))->clapPlugin();
  default:
    return nullptr;
  }
}

clap_plugin const*
create_plugin_wrapper(
  clap_plugin_descriptor const* desc, clap_host const* host,
  std::unique_ptr<plugin> plugin, bridge_config const& config)
{
  if (config.misbehaviour == misbehaviour_handler::Terminate)
    return create_checked<misbehaviour_handler::Terminate>(config.checking, desc, host, std::move(plugin));
  return create_checked<misbehaviour_handler::Ignore>(config.checking, desc, host, std::move(plugin));
}

}
