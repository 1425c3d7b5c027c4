#include "test_host.hpp"

#include <plugin_bridge/host/instance.hpp>
#include <plugin_bridge/plugin/registry.hpp>
#include <plugin_bridge/extensions/gui.hpp>
#include <plugin_bridge/extensions/log.hpp>
#include <plugin_bridge/extensions/params.hpp>
#include <plugin_bridge/extensions/extension.hpp>

#include <catch2/catch.hpp>
#include <string>
#include <optional>
#include <string_view>

using namespace plugin_bridge;
using namespace plugin_bridge_test;

namespace {

static std::optional<log_error> _nul_log_result = {};
static bool _host_params_found = true;

static bool CLAP_ABI
partial_is_api_supported(clap_plugin const* plugin, char const* api, bool is_floating)
{ return same_id(api, CLAP_WINDOW_API_X11) && !is_floating; }

static bool CLAP_ABI
partial_get_size(clap_plugin const* plugin, std::uint32_t* width, std::uint32_t* height)
{
  *width = 0;
  *height = 300;
  return true;
}

// claims success but fills one aspect ratio field only
static bool CLAP_ABI
partial_get_resize_hints(clap_plugin const* plugin, clap_gui_resize_hints* hints)
{
  hints->can_resize_horizontally = true;
  hints->aspect_ratio_width = 16;
  return true;
}

// everything else left out on purpose
static clap_plugin_gui const*
partial_gui_table()
{
  static clap_plugin_gui table = {};
  table.is_api_supported = partial_is_api_supported;
  table.get_size = partial_get_size;
  table.get_resize_hints = partial_get_resize_hints;
  return &table;
}

class silent_plugin:
public plugin
{
public:
  result<process_status, plugin_error>
  process(host_audio_thread_handle const& host, process_context const& context) override
  { return process_status::sleep; }
};

class partial_gui_plugin final:
public silent_plugin
{
public:
  void declare_extensions(extension_declarations& declarations) override
  { declarations.add_raw(CLAP_EXT_GUI, partial_gui_table()); }
};

class logging_plugin final:
public silent_plugin
{
public:
  status<plugin_error> init(host_main_thread_handle const& host) override
  {
    auto log = host.extension<host_log>();
    if (!log) return plugin_error::init;
    _host_params_found = host.extension<host_params>().has_value();
    auto bad = log->log_str(host, log_severity::info, std::string_view("a\0b", 3));
    _nul_log_result = bad.error_if_any();
    if (!log->log_format(host, log_severity::warning, "value ", 42, " of ", 1.5).ok())
      return plugin_error::init;
    return {};
  }
};

class full_gui_plugin final:
public silent_plugin,
public plugin_gui_impl
{
public:
  bool created = false;
  double scale = 1.0;

  void declare_extensions(extension_declarations& declarations) override
  { declarations.add<plugin_gui_impl>(*this); }

  bool is_api_supported(host_main_thread_handle const& host, gui_configuration const& config) override
  { return same_id(config.api, CLAP_WINDOW_API_X11); }
  status<gui_error> create(host_main_thread_handle const& host, gui_configuration const& config) override
  { created = true; return {}; }
  void destroy(host_main_thread_handle const& host) override { created = false; }
  status<gui_error> set_scale(host_main_thread_handle const& host, double value) override
  { scale = value; return {}; }
  std::optional<gui_size> get_size(host_main_thread_handle const& host) override
  { return gui_size { 640, 480 }; }
  std::optional<gui_resize_hints> get_resize_hints(host_main_thread_handle const& host) override
  { return gui_resize_hints { true, false, true, 16, 9 }; }
  status<gui_error> set_parent(host_main_thread_handle const& host, gui_window const& window) override
  { return created ? status<gui_error>() : gui_error::set_parent; }
  status<gui_error> show(host_main_thread_handle const& host) override { return {}; }
  status<gui_error> hide(host_main_thread_handle const& host) override { return gui_error::hide; }
};

// plugin side outcomes of host extension calls made during init
struct request_outcomes
{
  std::string host_name;
  bool params_found = false;
  std::optional<gui_error> resize_small;
  std::optional<gui_error> resize_large;
  std::optional<gui_error> show;
  std::optional<gui_error> hide;
};

static request_outcomes _requests = {};

class requesting_plugin final:
public silent_plugin
{
public:
  status<plugin_error> init(host_main_thread_handle const& host) override
  {
    _requests.host_name = host.proxy().name();
    auto params = host.extension<host_params>();
    _requests.params_found = params.has_value();
    if (params)
    {
      params->rescan(host, CLAP_PARAM_RESCAN_VALUES);
      params->clear(host, 3, CLAP_PARAM_CLEAR_ALL);
      params->request_flush(host);
    }
    auto gui = host.extension<host_gui>();
    if (!gui) return plugin_error::init;
    _requests.resize_small = gui->request_resize(host, { 100, 200 }).error_if_any();
    _requests.resize_large = gui->request_resize(host, { 4000, 200 }).error_if_any();
    _requests.show = gui->request_show(host).error_if_any();
    _requests.hide = gui->request_hide(host).error_if_any();
    gui->closed(host, true);
    return {};
  }
};

// answers params and gui requests, has no log
class requesting_host final:
public host,
public host_params_impl,
public host_gui_impl
{
public:
  int rescans = 0;
  int clears = 0;
  int flush_requests = 0;
  int closes = 0;

  void request_restart() override {}
  void request_process() override {}
  void request_callback() override {}
  void declare_extensions(extension_declarations& declarations) override
  {
    declarations.add<host_params_impl>(*this);
    declarations.add<host_gui_impl>(*this);
  }

  void rescan(clap_param_rescan_flags flags) override { rescans++; }
  void clear(clap_id param_id, clap_param_clear_flags flags) override { clears++; }
  void request_flush() override { flush_requests++; }

  status<gui_error> request_resize(gui_size const& size) override
  { return size.width <= 1000 ? status<gui_error>() : gui_error::resize; }
  status<gui_error> request_show() override { return gui_error::request_show; }
  status<gui_error> request_hide() override { return {}; }
  void closed(bool was_destroyed) override { closes++; }
};

plugin_descriptor_info
stub_descriptor(char const* id)
{
  plugin_descriptor_info info;
  info.id = id;
  info.name = id;
  info.vendor = "Plugin Bridge";
  info.version = "1.0.0";
  return info;
}

struct stub_registry
{
  plugin_registry registry;
  stub_registry()
  {
    registry.add(stub_descriptor("test.partial_gui"), []() -> std::unique_ptr<plugin> { return std::make_unique<partial_gui_plugin>(); });
    registry.add(stub_descriptor("test.logging"), []() -> std::unique_ptr<plugin> { return std::make_unique<logging_plugin>(); });
    registry.add(stub_descriptor("test.full_gui"), []() -> std::unique_ptr<plugin> { return std::make_unique<full_gui_plugin>(); });
    registry.add(stub_descriptor("test.requesting"), []() -> std::unique_ptr<plugin> { return std::make_unique<requesting_plugin>(); });
  }
};

}

TEST_CASE("cache asks the peer once per id", "[extensions]")
{
  int queries = 0;
  int table = 0;
  extension_cache cache;
  auto query = [&](char const* id) -> void const* {
    queries++;
    return same_id(id, "present") ? &table : nullptr;
  };

  REQUIRE(cache.state("present") == negotiation_state::unqueried);
  REQUIRE(cache.get("present", query) == &table);
  REQUIRE(cache.get("present", query) == &table);
  REQUIRE(queries == 1);
  REQUIRE(cache.state("present") == negotiation_state::supported);

  REQUIRE(cache.get("absent", query) == nullptr);
  REQUIRE(cache.get("absent", query) == nullptr);
  REQUIRE(queries == 2);
  REQUIRE(cache.state("absent") == negotiation_state::unsupported);

  cache.clear();
  REQUIRE(cache.state("present") == negotiation_state::unqueried);
}

TEST_CASE("first declaration of an id wins", "[extensions]")
{
  int first = 0;
  int second = 0;
  extension_declarations declarations;
  declarations.add_raw("ext", &first);
  declarations.add_raw("ext", &second);
  REQUIRE(declarations.size() == 1);
  REQUIRE(declarations.find_table("ext") == &first);
  REQUIRE(declarations.find_table("other") == nullptr);
}

TEST_CASE("partial gui table falls back to neutral answers", "[extensions][gui]")
{
  test_host host;
  stub_registry stubs;
  auto created = plugin_instance::create(host, test_host_info(), stubs.registry.factory(), "test.partial_gui");
  REQUIRE(created.ok());
  auto& instance = *created.value();

  auto gui = instance.extension<plugin_gui>();
  REQUIRE(gui.has_value());
  REQUIRE(instance.extension<plugin_params>() == std::nullopt);

  instance.main_thread([&](plugin_main_thread_handle const& plugin) {
    REQUIRE(gui->is_api_supported(plugin, { CLAP_WINDOW_API_X11, false }));
    REQUIRE_FALSE(gui->is_api_supported(plugin, { CLAP_WINDOW_API_X11, true }));
    REQUIRE_FALSE(gui->can_resize(plugin));
    REQUIRE_FALSE(gui->get_size(plugin).has_value());
    REQUIRE_FALSE(gui->get_preferred_api(plugin).has_value());
    REQUIRE_FALSE(gui->get_resize_hints(plugin).has_value());
    REQUIRE_FALSE(gui->adjust_size(plugin, { 100, 100 }).has_value());
    REQUIRE(gui->create(plugin, { CLAP_WINDOW_API_X11, false }).error() == gui_error::create);
    REQUIRE(gui->set_scale(plugin, 2.0).error() == gui_error::set_scale);
    REQUIRE(gui->set_size(plugin, { 100, 100 }).error() == gui_error::set_size);
    REQUIRE(gui->set_parent(plugin, gui_window::from_x11(1)).error() == gui_error::set_parent);
    REQUIRE(gui->set_transient(plugin, gui_window::from_x11(1)).error() == gui_error::set_parent);
    REQUIRE(gui->show(plugin).error() == gui_error::show);
    REQUIRE(gui->hide(plugin).error() == gui_error::hide);
    gui->suggest_title(plugin, "ignored");
    gui->destroy(plugin);
  });
}

TEST_CASE("gui implementation is reached through the table", "[extensions][gui]")
{
  test_host host;
  stub_registry stubs;
  auto created = plugin_instance::create(host, test_host_info(), stubs.registry.factory(), "test.full_gui");
  REQUIRE(created.ok());
  auto& instance = *created.value();
  auto gui = instance.extension<plugin_gui>();
  REQUIRE(gui.has_value());

  instance.main_thread([&](plugin_main_thread_handle const& plugin) {
    auto window = gui_window::from_x11(7);
    REQUIRE(window.api() == std::string(CLAP_WINDOW_API_X11));
    REQUIRE(gui->set_parent(plugin, window).error() == gui_error::set_parent);
    REQUIRE(gui->create(plugin, { CLAP_WINDOW_API_X11, false }).ok());
    REQUIRE(gui->set_parent(plugin, window).ok());
    REQUIRE(gui->set_scale(plugin, 1.5).ok());
    auto size = gui->get_size(plugin);
    REQUIRE(size.has_value());
    REQUIRE(size->width == 640);
    REQUIRE(size->height == 480);
    auto hints = gui->get_resize_hints(plugin);
    REQUIRE(hints.has_value());
    REQUIRE(hints->can_resize_horizontally);
    REQUIRE_FALSE(hints->can_resize_vertically);
    REQUIRE(hints->aspect_ratio_width == 16);
    REQUIRE(hints->aspect_ratio_height == 9);
    REQUIRE(gui->set_size(plugin, { 800, 600 }).error() == gui_error::set_size);
    REQUIRE(gui->show(plugin).ok());
    REQUIRE(gui->hide(plugin).error() == gui_error::hide);
    gui->destroy(plugin);
  });
}

TEST_CASE("host log forwards and refuses embedded nul", "[extensions][log]")
{
  test_host host;
  stub_registry stubs;
  _nul_log_result.reset();
  auto created = plugin_instance::create(host, test_host_info(), stubs.registry.factory(), "test.logging");
  REQUIRE(created.ok());
  REQUIRE(_nul_log_result == log_error::embedded_nul);
  REQUIRE_FALSE(_host_params_found);
  REQUIRE(host.messages.size() == 1);
  REQUIRE(host.messages[0].first == log_severity::warning);
  REQUIRE(host.messages[0].second == "value 42 of 1.5");
}

TEST_CASE("log severities", "[extensions][log]")
{
  REQUIRE(log_severity_from_raw(CLAP_LOG_ERROR) == log_severity::error);
  REQUIRE(log_severity_from_raw(CLAP_LOG_PLUGIN_MISBEHAVING) == log_severity::plugin_misbehaving);
  REQUIRE_FALSE(log_severity_from_raw(99).has_value());
  REQUIRE(std::string(log_severity_name(log_severity::fatal)) == "fatal");
}

TEST_CASE("host side tables answer plugin requests", "[extensions][gui][params]")
{
  requesting_host host;
  stub_registry stubs;
  _requests = {};
  auto created = plugin_instance::create(host, test_host_info(), stubs.registry.factory(), "test.requesting");
  REQUIRE(created.ok());
  REQUIRE(_requests.host_name == "Test Host");
  REQUIRE(_requests.params_found);
  REQUIRE(host.rescans == 1);
  REQUIRE(host.clears == 1);
  REQUIRE(host.flush_requests == 1);
  REQUIRE_FALSE(_requests.resize_small.has_value());
  REQUIRE(_requests.resize_large == gui_error::resize);
  REQUIRE(_requests.show == gui_error::request_show);
  REQUIRE_FALSE(_requests.hide.has_value());
  REQUIRE(host.closes == 1);
}
