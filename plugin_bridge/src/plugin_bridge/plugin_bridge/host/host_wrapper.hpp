#pragma once

#include <plugin_bridge/host/host.hpp>
#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/shared/boundary.hpp>
#include <plugin_bridge/extensions/extension.hpp>

#include <clap/host.h>

#include <thread>
#include <string>

namespace plugin_bridge {

// Owns the clap_host handed to one plugin instance.
// host_data points back here, so the address is pinned.
class host_wrapper final {
  clap_host _clap = {};
  host_info const _info;
  host& _host;
  bridge_config const _config;
  std::thread::id const _main_thread;
  extension_declarations _extensions = {};

  static void const* CLAP_ABI clap_get_extension(clap_host const* host, char const* id);
  static void CLAP_ABI clap_request_restart(clap_host const* host);
  static void CLAP_ABI clap_request_process(clap_host const* host);
  static void CLAP_ABI clap_request_callback(clap_host const* host);

  template <class Impl> Impl* find_impl(char const* func) const;
  void check_main_thread(char const* func) const;

public:
  PBRIDGE_PIN_ADDRESS(host_wrapper);
  host_wrapper(host& host, host_info const& info, bridge_config const& config);

  clap_host const* as_raw() const { return &_clap; }
  host_info const& info() const { return _info; }
  bridge_config const& config() const { return _config; }
  extension_declarations const& extensions() const { return _extensions; }
  bool on_main_thread() const { return std::this_thread::get_id() == _main_thread; }

  // null (and reported) for a null or foreign pointer
  static host_wrapper* from_raw(clap_host const* host, char const* func);

  // Trampoline bodies for host side extension tables.
  // f receives the declared implementation of Impl.
  template <class Impl, class R, class F> static R
  dispatch(clap_host const* host, char const* func, R failure, F&& f) noexcept;
  template <class Impl, class F> static void
  dispatch_void(clap_host const* host, char const* func, F&& f) noexcept;
  template <class Impl, class R, class F> static R
  dispatch_main(clap_host const* host, char const* func, R failure, F&& f) noexcept;
  template <class Impl, class F> static void
  dispatch_main_void(clap_host const* host, char const* func, F&& f) noexcept;
};

template <class Impl> Impl*
host_wrapper::find_impl(char const* func) const
{
  auto impl = _extensions.template find_impl<Impl>();
  if (impl == nullptr)
    report_misbehaviour(_config, func, std::string("Extension table called without implementation: ") + Impl::extension_id() + ".");
  return impl;
}

template <class Impl, class R, class F> R
host_wrapper::dispatch(clap_host const* host, char const* func, R failure, F&& f) noexcept
{
  return guard_boundary(func, failure, [&]() -> R {
    auto wrapper = from_raw(host, func);
    if (wrapper == nullptr) return failure;
    auto impl = wrapper->template find_impl<Impl>(func);
    if (impl == nullptr) return failure;
    return f(*impl);
  });
}

template <class Impl, class F> void
host_wrapper::dispatch_void(clap_host const* host, char const* func, F&& f) noexcept
{
  guard_boundary_void(func, [&]() {
    auto wrapper = from_raw(host, func);
    if (wrapper == nullptr) return;
    auto impl = wrapper->template find_impl<Impl>(func);
    if (impl == nullptr) return;
    f(*impl);
  });
}

template <class Impl, class R, class F> R
host_wrapper::dispatch_main(clap_host const* host, char const* func, R failure, F&& f) noexcept
{
  return guard_boundary(func, failure, [&]() -> R {
    auto wrapper = from_raw(host, func);
    if (wrapper == nullptr) return failure;
    wrapper->check_main_thread(func);
    auto impl = wrapper->template find_impl<Impl>(func);
    if (impl == nullptr) return failure;
    return f(*impl);
  });
}

template <class Impl, class F> void
host_wrapper::dispatch_main_void(clap_host const* host, char const* func, F&& f) noexcept
{
  guard_boundary_void(func, [&]() {
    auto wrapper = from_raw(host, func);
    if (wrapper == nullptr) return;
    wrapper->check_main_thread(func);
    auto impl = wrapper->template find_impl<Impl>(func);
    if (impl == nullptr) return;
    f(*impl);
  });
}

}
