#pragma once

#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/extensions/extension.hpp>

#include <clap/host.h>
#include <clap/helpers/host-proxy.hh>

#include <string>
#include <optional>

namespace plugin_bridge {

// Plugin owned view of the host of one instance. Requests go through
// the clap-helpers proxy of the wrapper, typed extension facades are
// negotiated here on the main thread only.
class host_proxy {
  clap_host const* const _host;
  extension_cache _cache = {};

protected:
  explicit host_proxy(clap_host const* host);

public:
  PBRIDGE_PIN_ADDRESS(host_proxy);
  virtual ~host_proxy() = default;

  clap_host const* as_raw() const { return _host; }
  std::string name() const { return to_8bit_string(_host->name); }
  std::string vendor() const { return to_8bit_string(_host->vendor); }
  std::string url() const { return to_8bit_string(_host->url); }
  std::string version() const { return to_8bit_string(_host->version); }

  virtual void request_restart() const = 0;
  virtual void request_process() const = 0;
  virtual void request_callback() const = 0;

  template <class Ext> std::optional<Ext> negotiate();
  negotiation_state state(char const* id) const { return _cache.state(id); }
};

template <misbehaviour_handler H, checking_level L>
class helpers_host_proxy final:
public host_proxy
{
  ::clap::helpers::HostProxy<H, L>& _helpers;

public:
  explicit helpers_host_proxy(::clap::helpers::HostProxy<H, L>& helpers):
  host_proxy(helpers.host()), _helpers(helpers) {}

  void request_restart() const override { _helpers.requestRestart(); }
  void request_process() const override { _helpers.requestProcess(); }
  void request_callback() const override { _helpers.requestCallback(); }
};

template <class Ext> std::optional<Ext>
host_proxy::negotiate()
{
  return _cache.template negotiate<Ext>([this](char const* id) -> void const* {
    if (_host->get_extension == nullptr) return nullptr;
    return _host->get_extension(_host, id);
  });
}

template <class Ext> std::optional<Ext>
host_main_thread_handle::extension() const
{ return _proxy->template negotiate<Ext>(); }

}
