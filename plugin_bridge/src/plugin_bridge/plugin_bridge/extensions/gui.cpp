#include <plugin_bridge/extensions/gui.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <limits>

namespace plugin_bridge {

char const*
gui_error_text(gui_error error)
{
  switch (error)
  {
  case gui_error::create: return "Plugin failed to create its gui.";
  case gui_error::set_scale: return "Plugin refused the gui scale.";
  case gui_error::set_size: return "Plugin refused the gui size.";
  case gui_error::set_parent: return "Plugin failed to embed its gui.";
  case gui_error::show: return "Plugin failed to show its gui.";
  case gui_error::hide: return "Plugin failed to hide its gui.";
  case gui_error::resize: return "Host refused the gui resize request.";
  case gui_error::request_show: return "Host refused to show the gui.";
  case gui_error::request_hide: return "Host refused to hide the gui.";
  default: return "Unknown gui error.";
  }
}

gui_window
gui_window::from_x11(clap_xwnd window)
{
  clap_window raw = {};
  raw.api = CLAP_WINDOW_API_X11;
  raw.x11 = window;
  return gui_window(raw);
}

gui_window
gui_window::from_win32(clap_hwnd window)
{
  clap_window raw = {};
  raw.api = CLAP_WINDOW_API_WIN32;
  raw.win32 = window;
  return gui_window(raw);
}

gui_window
gui_window::from_cocoa(clap_nsview view)
{
  clap_window raw = {};
  raw.api = CLAP_WINDOW_API_COCOA;
  raw.cocoa = view;
  return gui_window(raw);
}

static status<gui_error>
to_status(bool ok, gui_error error)
{
  if (ok) return {};
  return error;
}

bool
plugin_gui::is_api_supported(plugin_main_thread_handle const& plugin, gui_configuration const& config) const
{
  if (_table->is_api_supported == nullptr) return false;
  return _table->is_api_supported(plugin.as_raw(), config.api, config.is_floating);
}

std::optional<gui_configuration>
plugin_gui::get_preferred_api(plugin_main_thread_handle const& plugin) const
{
  if (_table->get_preferred_api == nullptr) return std::nullopt;
  char const* api = nullptr;
  bool is_floating = false;
  if (!_table->get_preferred_api(plugin.as_raw(), &api, &is_floating) || api == nullptr) return std::nullopt;
  return gui_configuration { api, is_floating };
}

status<gui_error>
plugin_gui::create(plugin_main_thread_handle const& plugin, gui_configuration const& config) const
{
  if (_table->create == nullptr) return gui_error::create;
  return to_status(_table->create(plugin.as_raw(), config.api, config.is_floating), gui_error::create);
}

void
plugin_gui::destroy(plugin_main_thread_handle const& plugin) const
{
  if (_table->destroy != nullptr)
    _table->destroy(plugin.as_raw());
}

status<gui_error>
plugin_gui::set_scale(plugin_main_thread_handle const& plugin, double scale) const
{
  if (_table->set_scale == nullptr) return gui_error::set_scale;
  return to_status(_table->set_scale(plugin.as_raw(), scale), gui_error::set_scale);
}

std::optional<gui_size>
plugin_gui::get_size(plugin_main_thread_handle const& plugin) const
{
  if (_table->get_size == nullptr) return std::nullopt;
  gui_size size = { 0, 0 };
  if (!_table->get_size(plugin.as_raw(), &size.width, &size.height)) return std::nullopt;
  if (size.width == 0 || size.height == 0) return std::nullopt;
  return size;
}

bool
plugin_gui::can_resize(plugin_main_thread_handle const& plugin) const
{
  if (_table->can_resize == nullptr) return false;
  return _table->can_resize(plugin.as_raw());
}

// hints the plugin claims to fill but leaves partly untouched count as absent
std::optional<gui_resize_hints>
plugin_gui::get_resize_hints(plugin_main_thread_handle const& plugin) const
{
  if (_table->get_resize_hints == nullptr) return std::nullopt;
  auto constexpr unset = std::numeric_limits<std::uint32_t>::max();
  clap_gui_resize_hints raw = {};
  raw.aspect_ratio_width = unset;
  raw.aspect_ratio_height = unset;
  if (!_table->get_resize_hints(plugin.as_raw(), &raw)) return std::nullopt;
  if (raw.aspect_ratio_width == unset || raw.aspect_ratio_height == unset) return std::nullopt;
  return gui_resize_hints {
    raw.can_resize_horizontally, raw.can_resize_vertically, raw.preserve_aspect_ratio,
    raw.aspect_ratio_width, raw.aspect_ratio_height };
}

std::optional<gui_size>
plugin_gui::adjust_size(plugin_main_thread_handle const& plugin, gui_size const& size) const
{
  if (_table->adjust_size == nullptr) return std::nullopt;
  gui_size result = size;
  if (!_table->adjust_size(plugin.as_raw(), &result.width, &result.height)) return std::nullopt;
  return result;
}

status<gui_error>
plugin_gui::set_size(plugin_main_thread_handle const& plugin, gui_size const& size) const
{
  if (_table->set_size == nullptr) return gui_error::set_size;
  return to_status(_table->set_size(plugin.as_raw(), size.width, size.height), gui_error::set_size);
}

status<gui_error>
plugin_gui::set_parent(plugin_main_thread_handle const& plugin, gui_window const& window) const
{
  if (_table->set_parent == nullptr) return gui_error::set_parent;
  return to_status(_table->set_parent(plugin.as_raw(), window.as_raw()), gui_error::set_parent);
}

status<gui_error>
plugin_gui::set_transient(plugin_main_thread_handle const& plugin, gui_window const& window) const
{
  if (_table->set_transient == nullptr) return gui_error::set_parent;
  return to_status(_table->set_transient(plugin.as_raw(), window.as_raw()), gui_error::set_parent);
}

void
plugin_gui::suggest_title(plugin_main_thread_handle const& plugin, std::string const& title) const
{
  if (_table->suggest_title != nullptr)
    _table->suggest_title(plugin.as_raw(), title.c_str());
}

status<gui_error>
plugin_gui::show(plugin_main_thread_handle const& plugin) const
{
  if (_table->show == nullptr) return gui_error::show;
  return to_status(_table->show(plugin.as_raw()), gui_error::show);
}

status<gui_error>
plugin_gui::hide(plugin_main_thread_handle const& plugin) const
{
  if (_table->hide == nullptr) return gui_error::hide;
  return to_status(_table->hide(plugin.as_raw()), gui_error::hide);
}

void
host_gui::resize_hints_changed(host_handle const& host) const
{
  if (_table->resize_hints_changed != nullptr)
    _table->resize_hints_changed(host.as_raw());
}

status<gui_error>
host_gui::request_resize(host_handle const& host, gui_size const& size) const
{
  if (_table->request_resize == nullptr) return gui_error::resize;
  return to_status(_table->request_resize(host.as_raw(), size.width, size.height), gui_error::resize);
}

status<gui_error>
host_gui::request_show(host_handle const& host) const
{
  if (_table->request_show == nullptr) return gui_error::request_show;
  return to_status(_table->request_show(host.as_raw()), gui_error::request_show);
}

status<gui_error>
host_gui::request_hide(host_handle const& host) const
{
  if (_table->request_hide == nullptr) return gui_error::request_hide;
  return to_status(_table->request_hide(host.as_raw()), gui_error::request_hide);
}

void
host_gui::closed(host_handle const& host, bool was_destroyed) const
{
  if (_table->closed != nullptr)
    _table->closed(host.as_raw(), was_destroyed);
}

void
to_raw(gui_resize_hints const& hints, clap_gui_resize_hints& raw)
{
  raw.can_resize_horizontally = hints.can_resize_horizontally;
  raw.can_resize_vertically = hints.can_resize_vertically;
  raw.preserve_aspect_ratio = hints.preserve_aspect_ratio;
  raw.aspect_ratio_width = hints.aspect_ratio_width;
  raw.aspect_ratio_height = hints.aspect_ratio_height;
}

// the abi only carries the verdict, the reason goes to the log
static bool
accepted(char const* func, status<gui_error> const& verdict)
{
  if (verdict.ok()) return true;
  write_log(log_level::info, __FILE__, __LINE__, func, gui_error_text(verdict.error()));
  return false;
}

static void CLAP_ABI
clap_host_gui_resize_hints_changed(clap_host const* host)
{
  host_wrapper::dispatch_void<host_gui_impl>(host, __func__,
    [](host_gui_impl& impl) { impl.resize_hints_changed(); });
}

static bool CLAP_ABI
clap_host_gui_request_resize(clap_host const* host, std::uint32_t width, std::uint32_t height)
{
  auto func = __func__;
  return host_wrapper::dispatch<host_gui_impl>(host, func, false,
    [=](host_gui_impl& impl) { return accepted(func, impl.request_resize({ width, height })); });
}

static bool CLAP_ABI
clap_host_gui_request_show(clap_host const* host)
{
  auto func = __func__;
  return host_wrapper::dispatch<host_gui_impl>(host, func, false,
    [=](host_gui_impl& impl) { return accepted(func, impl.request_show()); });
}

static bool CLAP_ABI
clap_host_gui_request_hide(clap_host const* host)
{
  auto func = __func__;
  return host_wrapper::dispatch<host_gui_impl>(host, func, false,
    [=](host_gui_impl& impl) { return accepted(func, impl.request_hide()); });
}

static void CLAP_ABI
clap_host_gui_closed(clap_host const* host, bool was_destroyed)
{
  host_wrapper::dispatch_void<host_gui_impl>(host, __func__,
    [=](host_gui_impl& impl) { impl.closed(was_destroyed); });
}

clap_host_gui const*
host_gui_impl::extension_table()
{
  static clap_host_gui const table = {
    .resize_hints_changed = clap_host_gui_resize_hints_changed,
    .request_resize = clap_host_gui_request_resize,
    .request_show = clap_host_gui_request_show,
    .request_hide = clap_host_gui_request_hide,
    .closed = clap_host_gui_closed };
  return &table;
}

}
