#include <plugin_bridge/host/host_wrapper.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <clap/version.h>

namespace plugin_bridge {

host_wrapper::
host_wrapper(host& host, host_info const& info, bridge_config const& config):
_info(info), _host(host), _config(config), _main_thread(std::this_thread::get_id())
{
  _clap.clap_version = CLAP_VERSION;
  _clap.host_data = this;
  _clap.name = _info.name.c_str();
  _clap.vendor = _info.vendor.c_str();
  _clap.url = _info.url.c_str();
  _clap.version = _info.version.c_str();
  _clap.get_extension = clap_get_extension;
  _clap.request_restart = clap_request_restart;
  _clap.request_process = clap_request_process;
  _clap.request_callback = clap_request_callback;
  _host.declare_extensions(_extensions);
}

host_wrapper*
host_wrapper::from_raw(clap_host const* host, char const* func)
{
  if (host == nullptr || host->host_data == nullptr)
  {
    report_misbehaviour({}, func, "Plugin passed a null host.");
    return nullptr;
  }
  auto wrapper = static_cast<host_wrapper*>(host->host_data);
  if (wrapper->as_raw() != host)
  {
    report_misbehaviour({}, func, "Plugin passed a foreign host.");
    return nullptr;
  }
  return wrapper;
}

void
host_wrapper::check_main_thread(char const* func) const
{
  if (_config.checks_threads() && !on_main_thread())
    report_misbehaviour(_config, func, "Plugin called a main thread function from another thread.");
}

void const* CLAP_ABI
host_wrapper::clap_get_extension(clap_host const* host, char const* id)
{
  auto func = __func__;
  return guard_boundary(func, static_cast<void const*>(nullptr), [host, id, func]() -> void const* {
    auto wrapper = from_raw(host, func);
    if (wrapper == nullptr || id == nullptr) return nullptr;
    return wrapper->_extensions.find_table(id);
  });
}

void CLAP_ABI
host_wrapper::clap_request_restart(clap_host const* host)
{
  auto func = __func__;
  guard_boundary_void(func, [host, func]() {
    if (auto wrapper = from_raw(host, func))
      wrapper->_host.request_restart();
  });
}

void CLAP_ABI
host_wrapper::clap_request_process(clap_host const* host)
{
  auto func = __func__;
  guard_boundary_void(func, [host, func]() {
    if (auto wrapper = from_raw(host, func))
      wrapper->_host.request_process();
  });
}

void CLAP_ABI
host_wrapper::clap_request_callback(clap_host const* host)
{
  auto func = __func__;
  guard_boundary_void(func, [host, func]() {
    if (auto wrapper = from_raw(host, func))
      wrapper->_host.request_callback();
  });
}

}
