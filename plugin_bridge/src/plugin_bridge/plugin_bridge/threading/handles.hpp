#pragma once

#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/shared/utility.hpp>

#include <clap/host.h>
#include <clap/plugin.h>

#include <optional>

namespace plugin_bridge {

class host_proxy;
class plugin_instance;
template <misbehaviour_handler H, checking_level L> class plugin_wrapper;

// Plugin side view of the host, usable on any thread.
// Handles live for the duration of one call and are
// only ever minted by the dispatching wrapper.
class host_handle {
  template <misbehaviour_handler, checking_level> friend class plugin_wrapper;

protected:
  host_proxy* const _proxy;
  explicit host_handle(host_proxy* proxy);

public:
  PBRIDGE_PIN_ADDRESS(host_handle);

  clap_host const* as_raw() const;
  host_proxy const& proxy() const { return *_proxy; }

  void request_restart() const;
  void request_process() const;
  void request_callback() const;
};

class host_main_thread_handle final:
public host_handle
{
  template <misbehaviour_handler, checking_level> friend class plugin_wrapper;
  explicit host_main_thread_handle(host_proxy* proxy) : host_handle(proxy) {}

public:
  // Queries the host once per extension, later calls hit the cache.
  // Defined in host_proxy.hpp.
  template <class Ext> std::optional<Ext> extension() const;
};

class host_audio_thread_handle final:
public host_handle
{
  template <misbehaviour_handler, checking_level> friend class plugin_wrapper;
  explicit host_audio_thread_handle(host_proxy* proxy) : host_handle(proxy) {}
};

// Host side view of the plugin, usable on any thread.
class plugin_handle {
  friend class plugin_instance;

protected:
  clap_plugin const* const _plugin;
  explicit plugin_handle(clap_plugin const* plugin) : _plugin(plugin) {}

public:
  PBRIDGE_PIN_ADDRESS(plugin_handle);
  clap_plugin const* as_raw() const { return _plugin; }
};

class plugin_main_thread_handle final:
public plugin_handle
{
  friend class plugin_instance;
  explicit plugin_main_thread_handle(clap_plugin const* plugin) : plugin_handle(plugin) {}
};

class plugin_audio_thread_handle final:
public plugin_handle
{
  friend class plugin_instance;
  explicit plugin_audio_thread_handle(clap_plugin const* plugin) : plugin_handle(plugin) {}
};

}
