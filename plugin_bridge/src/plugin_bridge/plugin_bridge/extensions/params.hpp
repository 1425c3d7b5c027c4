#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/events/event_list.hpp>
#include <plugin_bridge/threading/handles.hpp>

#include <clap/ext/params.h>

#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

namespace plugin_bridge {

struct param_info
{
  clap_id id;
  clap_param_info_flags flags;
  void* cookie;
  std::string name;
  std::string module;
  double min_value;
  double max_value;
  double default_value;

  bool is_stepped() const { return (flags & CLAP_PARAM_IS_STEPPED) != 0; }
  bool is_automatable() const { return (flags & CLAP_PARAM_IS_AUTOMATABLE) != 0; }
};

// Host side facade over the plugin's params table. Main thread,
// except flush which runs on the audio thread while the plugin is active.
class plugin_params final:
public extension<clap_plugin_params>
{
public:
  static std::uint32_t constexpr text_capacity = 256;
  static char const* id() { return CLAP_EXT_PARAMS; }
  explicit plugin_params(clap_plugin_params const* table) : extension(table) {}

  std::uint32_t count(plugin_main_thread_handle const& plugin) const;
  std::optional<param_info> get_info(plugin_main_thread_handle const& plugin, std::uint32_t index) const;
  std::optional<double> get_value(plugin_main_thread_handle const& plugin, clap_id param_id) const;
  std::optional<std::string> value_to_text(plugin_main_thread_handle const& plugin, clap_id param_id, double value) const;
  std::optional<double> text_to_value(plugin_main_thread_handle const& plugin, clap_id param_id, std::string const& text) const;
  void flush(plugin_handle const& plugin, input_event_list const& in, output_event_list const& out) const;
};

// Plugin side facade over the host's params table.
class host_params final:
public extension<clap_host_params>
{
public:
  static char const* id() { return CLAP_EXT_PARAMS; }
  explicit host_params(clap_host_params const* table) : extension(table) {}

  void rescan(host_main_thread_handle const& host, clap_param_rescan_flags flags) const;
  void clear(host_main_thread_handle const& host, clap_id param_id, clap_param_clear_flags flags) const;
  void request_flush(host_handle const& host) const;
};

class plugin_params_impl {
public:
  virtual ~plugin_params_impl() = default;

  virtual std::uint32_t count(host_main_thread_handle const& host) = 0;
  virtual std::optional<param_info> get_info(host_main_thread_handle const& host, std::uint32_t index) = 0;
  virtual std::optional<double> get_value(host_main_thread_handle const& host, clap_id param_id) = 0;
  virtual std::optional<std::string> value_to_text(host_main_thread_handle const& host, clap_id param_id, double value) = 0;
  virtual std::optional<double> text_to_value(host_main_thread_handle const& host, clap_id param_id, std::string_view text) { return std::nullopt; }
  virtual void flush(host_handle const& host, input_event_list const& in, output_event_list const& out) = 0;

  static char const* extension_id() { return CLAP_EXT_PARAMS; }

  // answered by the plugin wrapper's clap-helpers table
  static clap_plugin_params const* extension_table() { return nullptr; }
};

void to_raw(param_info const& info, clap_param_info& raw);

class host_params_impl {
public:
  virtual ~host_params_impl() = default;
  virtual void rescan(clap_param_rescan_flags flags) = 0;
  virtual void clear(clap_id param_id, clap_param_clear_flags flags) = 0;
  virtual void request_flush() = 0;

  static char const* extension_id() { return CLAP_EXT_PARAMS; }
  static clap_host_params const* extension_table();
};

}
