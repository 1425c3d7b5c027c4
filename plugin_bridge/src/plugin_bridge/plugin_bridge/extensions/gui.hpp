#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/shared/result.hpp>

#include <clap/ext/gui.h>

#include <string>
#include <cstdint>
#include <optional>

namespace plugin_bridge {

enum class gui_error {
  create, set_scale, set_size, set_parent, show, hide,
  resize, request_show, request_hide };
char const* gui_error_text(gui_error error);

// api strings are the static CLAP_WINDOW_API_ constants
// or live at least as long as the call they are passed to
struct gui_configuration
{
  char const* api;
  bool is_floating;
};

struct gui_size
{
  std::uint32_t width;
  std::uint32_t height;
};

struct gui_resize_hints
{
  bool can_resize_horizontally;
  bool can_resize_vertically;
  bool preserve_aspect_ratio;
  std::uint32_t aspect_ratio_width;
  std::uint32_t aspect_ratio_height;
};

// native parent or transient window, not owned
class gui_window final {
  clap_window _raw = {};

public:
  explicit gui_window(clap_window const& raw) : _raw(raw) {}
  static gui_window from_x11(clap_xwnd window);
  static gui_window from_win32(clap_hwnd window);
  static gui_window from_cocoa(clap_nsview view);

  char const* api() const { return _raw.api; }
  clap_window const* as_raw() const { return &_raw; }
};

// Host side facade over the plugin's gui table. Main thread.
// Entries the plugin left out behave as neutral defaults.
class plugin_gui final:
public extension<clap_plugin_gui>
{
public:
  static char const* id() { return CLAP_EXT_GUI; }
  explicit plugin_gui(clap_plugin_gui const* table) : extension(table) {}

  bool is_api_supported(plugin_main_thread_handle const& plugin, gui_configuration const& config) const;
  std::optional<gui_configuration> get_preferred_api(plugin_main_thread_handle const& plugin) const;
  status<gui_error> create(plugin_main_thread_handle const& plugin, gui_configuration const& config) const;
  void destroy(plugin_main_thread_handle const& plugin) const;
  status<gui_error> set_scale(plugin_main_thread_handle const& plugin, double scale) const;

  // empty when the plugin fails or reports a zero dimension
  std::optional<gui_size> get_size(plugin_main_thread_handle const& plugin) const;
  bool can_resize(plugin_main_thread_handle const& plugin) const;
  std::optional<gui_resize_hints> get_resize_hints(plugin_main_thread_handle const& plugin) const;
  std::optional<gui_size> adjust_size(plugin_main_thread_handle const& plugin, gui_size const& size) const;
  status<gui_error> set_size(plugin_main_thread_handle const& plugin, gui_size const& size) const;

  status<gui_error> set_parent(plugin_main_thread_handle const& plugin, gui_window const& window) const;
  status<gui_error> set_transient(plugin_main_thread_handle const& plugin, gui_window const& window) const;
  void suggest_title(plugin_main_thread_handle const& plugin, std::string const& title) const;
  status<gui_error> show(plugin_main_thread_handle const& plugin) const;
  status<gui_error> hide(plugin_main_thread_handle const& plugin) const;
};

// Plugin side facade over the host's gui table.
// Requests are accepted or refused now and applied later by the host.
class host_gui final:
public extension<clap_host_gui>
{
public:
  static char const* id() { return CLAP_EXT_GUI; }
  explicit host_gui(clap_host_gui const* table) : extension(table) {}

  void resize_hints_changed(host_handle const& host) const;
  status<gui_error> request_resize(host_handle const& host, gui_size const& size) const;
  status<gui_error> request_show(host_handle const& host) const;
  status<gui_error> request_hide(host_handle const& host) const;
  void closed(host_handle const& host, bool was_destroyed) const;
};

// Plugin side implementation of the gui table.
class plugin_gui_impl {
public:
  virtual ~plugin_gui_impl() = default;

  virtual bool is_api_supported(host_main_thread_handle const& host, gui_configuration const& config) = 0;
  virtual std::optional<gui_configuration> get_preferred_api(host_main_thread_handle const& host) { return std::nullopt; }
  virtual status<gui_error> create(host_main_thread_handle const& host, gui_configuration const& config) = 0;
  virtual void destroy(host_main_thread_handle const& host) = 0;
  virtual status<gui_error> set_scale(host_main_thread_handle const& host, double scale) { return gui_error::set_scale; }
  virtual std::optional<gui_size> get_size(host_main_thread_handle const& host) = 0;
  virtual bool can_resize(host_main_thread_handle const& host) { return false; }
  virtual std::optional<gui_resize_hints> get_resize_hints(host_main_thread_handle const& host) { return std::nullopt; }
  virtual std::optional<gui_size> adjust_size(host_main_thread_handle const& host, gui_size const& size) { return std::nullopt; }
  virtual status<gui_error> set_size(host_main_thread_handle const& host, gui_size const& size) { return gui_error::set_size; }
  virtual status<gui_error> set_parent(host_main_thread_handle const& host, gui_window const& window) = 0;
  virtual status<gui_error> set_transient(host_main_thread_handle const& host, gui_window const& window) { return gui_error::set_parent; }
  virtual void suggest_title(host_main_thread_handle const& host, std::string const& title) {}
  virtual status<gui_error> show(host_main_thread_handle const& host) = 0;
  virtual status<gui_error> hide(host_main_thread_handle const& host) = 0;

  static char const* extension_id() { return CLAP_EXT_GUI; }

  // answered by the plugin wrapper's clap-helpers table
  static clap_plugin_gui const* extension_table() { return nullptr; }
};

void to_raw(gui_resize_hints const& hints, clap_gui_resize_hints& raw);

// Host side implementation of the host gui table. Any thread.
class host_gui_impl {
public:
  virtual ~host_gui_impl() = default;
  virtual void resize_hints_changed() {}
  virtual status<gui_error> request_resize(gui_size const& size) = 0;
  virtual status<gui_error> request_show() = 0;
  virtual status<gui_error> request_hide() = 0;
  virtual void closed(bool was_destroyed) = 0;

  static char const* extension_id() { return CLAP_EXT_GUI; }
  static clap_host_gui const* extension_table();
};

}
