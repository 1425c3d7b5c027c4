#include "test_host.hpp"

#include <plugin_bridge/host/bundle.hpp>
#include <plugin_bridge/host/instance.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>
#include <plugin_bridge/plugin/registry.hpp>

#include <clap/entry.h>
#include <clap/version.h>
#include <clap/plugin-features.h>

#include <catch2/catch.hpp>
#include <memory>
#include <vector>
#include <string>
#include <optional>
#include <stdexcept>

using namespace plugin_bridge;
using namespace plugin_bridge_test;

namespace {

// counts lifecycle calls as they reach the implementation
struct lifecycle_counts
{
  int activate = 0;
  int deactivate = 0;
  int start = 0;
  int stop = 0;
  int reset = 0;
  int process = 0;
  int main_thread = 0;
  std::vector<std::uint32_t> event_times = {};
  std::optional<std::int64_t> steady_time = {};
  bool had_transport = false;
  bool stopped_before_deactivate = false;
};

static lifecycle_counts _counts = {};

class counting_plugin final:
public plugin
{
public:
  status<plugin_error> init(host_main_thread_handle const& host) override
  {
    host.request_restart();
    return {};
  }

  status<plugin_error> activate(host_main_thread_handle const& host, audio_configuration const& config) override
  { _counts.activate++; return {}; }
  void deactivate(host_main_thread_handle const& host) override
  {
    _counts.deactivate++;
    _counts.stopped_before_deactivate = _counts.stop > 0;
  }
  void on_main_thread(host_main_thread_handle const& host) override { _counts.main_thread++; }
  status<plugin_error> start_processing(host_audio_thread_handle const& host) override
  { _counts.start++; return {}; }
  void stop_processing(host_audio_thread_handle const& host) override { _counts.stop++; }
  void reset(host_audio_thread_handle const& host) override { _counts.reset++; }

  result<process_status, plugin_error>
  process(host_audio_thread_handle const& host, process_context const& context) override
  {
    _counts.process++;
    _counts.steady_time = context.steady_time();
    _counts.had_transport = context.transport().has_value();
    for (auto event : context.in_events())
    {
      _counts.event_times.push_back(event.time());
      if (!context.out_events().try_push(event)) return plugin_error::process;
    }
    host.request_process();
    return process_status::tail;
  }
};

class failing_init_plugin final:
public plugin
{
public:
  status<plugin_error> init(host_main_thread_handle const& host) override { return plugin_error::init; }
  result<process_status, plugin_error> process(host_audio_thread_handle const& host, process_context const& context) override
  { return process_status::sleep; }
};

class throwing_plugin final:
public plugin
{
public:
  result<process_status, plugin_error> process(host_audio_thread_handle const& host, process_context const& context) override
  { throw std::runtime_error("out of cheese"); }
};

plugin_descriptor_info
stub_descriptor(char const* id)
{
  plugin_descriptor_info info;
  info.id = id;
  info.name = id;
  info.vendor = "Plugin Bridge";
  info.version = "1.0.0";
  info.features = { CLAP_PLUGIN_FEATURE_AUDIO_EFFECT };
  return info;
}

void
register_stubs(plugin_registry& registry)
{
  registry.add(stub_descriptor("test.counting"), []() -> std::unique_ptr<plugin> { return std::make_unique<counting_plugin>(); });
  registry.add(stub_descriptor("test.failing_init"), []() -> std::unique_ptr<plugin> { return std::make_unique<failing_init_plugin>(); });
  registry.add(stub_descriptor("test.throwing"), []() -> std::unique_ptr<plugin> { return std::make_unique<throwing_plugin>(); });
}

audio_configuration const test_audio = { 48000.0, 1, 256 };

}

TEST_CASE("registry refuses duplicate ids", "[registry]")
{
  plugin_registry registry;
  register_stubs(registry);
  REQUIRE(registry.count() == 3);
  REQUIRE_FALSE(registry.add(stub_descriptor("test.counting"), []() -> std::unique_ptr<plugin> { return std::make_unique<counting_plugin>(); }));
  REQUIRE(registry.count() == 3);
  REQUIRE(registry.find("test.throwing") != nullptr);
  REQUIRE(registry.find("test.missing") == nullptr);

  auto factory = registry.factory();
  REQUIRE(factory->get_plugin_count(factory) == 3);
  auto desc = factory->get_plugin_descriptor(factory, 0);
  REQUIRE(std::string(desc->id) == "test.counting");
  REQUIRE(std::string(desc->features[0]) == CLAP_PLUGIN_FEATURE_AUDIO_EFFECT);
  REQUIRE(desc->features[1] == nullptr);
  REQUIRE(factory->get_plugin_descriptor(factory, 3) == nullptr);
  REQUIRE(registry.get_factory(CLAP_PLUGIN_FACTORY_ID) == factory);
  REQUIRE(registry.get_factory("unknown.factory") == nullptr);
}

TEST_CASE("instance creation failures", "[instance]")
{
  test_host host;
  plugin_registry registry;
  register_stubs(registry);

  auto missing = plugin_instance::create(host, test_host_info(), registry.factory(), "test.missing");
  REQUIRE_FALSE(missing.ok());
  REQUIRE(missing.error() == instance_error::plugin_not_found);

  auto no_factory = plugin_instance::create(host, test_host_info(), static_cast<clap_plugin_factory const*>(nullptr), "test.counting");
  REQUIRE_FALSE(no_factory.ok());
  REQUIRE(no_factory.error() == instance_error::plugin_not_found);

  auto failing = plugin_instance::create(host, test_host_info(), registry.factory(), "test.failing_init");
  REQUIRE_FALSE(failing.ok());
  REQUIRE(failing.error() == instance_error::init_failed);
}

TEST_CASE("instance lifecycle", "[instance]")
{
  _counts = {};
  test_host host;
  plugin_registry registry;
  register_stubs(registry);
  auto created = plugin_instance::create(host, test_host_info(), registry.factory(), "test.counting");
  REQUIRE(created.ok());
  auto& instance = *created.value();
  REQUIRE(host.restart_requests == 1);
  REQUIRE(std::string(instance.descriptor()->id) == "test.counting");

  SECTION("processing needs activation")
  {
    REQUIRE(instance.start_processing().error() == instance_error::not_activated);
    REQUIRE(instance.deactivate().error() == instance_error::not_activated);
    REQUIRE(instance.reset().error() == instance_error::not_activated);
    REQUIRE(_counts.start == 0);
  }

  SECTION("activate twice")
  {
    REQUIRE(instance.activate(test_audio).ok());
    REQUIRE(instance.activate(test_audio).error() == instance_error::already_activated);
    REQUIRE(_counts.activate == 1);
  }

  SECTION("deactivate stops processing first")
  {
    REQUIRE(instance.activate(test_audio).ok());
    REQUIRE(instance.start_processing().ok());
    REQUIRE(instance.is_processing());
    REQUIRE(instance.deactivate().ok());
    REQUIRE_FALSE(instance.is_processing());
    REQUIRE_FALSE(instance.is_active());
    REQUIRE(_counts.stop == 1);
    REQUIRE(_counts.deactivate == 1);
  }

  SECTION("process round trip")
  {
    REQUIRE(instance.activate(test_audio).ok());
    event_buffer in;
    event_buffer out;
    audio_port_buffers inputs;
    audio_port_buffers outputs;
    REQUIRE(instance.process(inputs, outputs, in, out, 16).error() == instance_error::not_processing);
    REQUIRE(instance.start_processing().ok());

    REQUIRE(in.push(note_on_event(2, pckn(0, 0, 60, 1), 1.0)));
    REQUIRE(in.push(note_off_event(9, pckn(0, 0, 60, 1), 0.0)));
    auto transport = transport_event(0).with_playing(true);
    auto status = instance.process(inputs, outputs, in, out, 16, 1024, &transport);
    REQUIRE(status.ok());
    REQUIRE(status.value() == process_status::tail);
    REQUIRE(_counts.event_times == std::vector<std::uint32_t> { 2, 9 });
    REQUIRE(_counts.steady_time == std::int64_t(1024));
    REQUIRE(_counts.had_transport);
    REQUIRE(out.size() == 2);
    REQUIRE(host.process_requests == 1);

    REQUIRE(instance.process(inputs, outputs, in, out, 16).ok());
    REQUIRE_FALSE(_counts.steady_time.has_value());
    REQUIRE_FALSE(_counts.had_transport);

    REQUIRE(instance.reset().ok());
    REQUIRE(instance.stop_processing().ok());
    REQUIRE(instance.stop_processing().error() == instance_error::not_processing);
    REQUIRE(_counts.reset == 1);
  }

  SECTION("main thread callback")
  {
    instance.on_main_thread();
    REQUIRE(_counts.main_thread == 1);
  }
}

TEST_CASE("out of order raw calls are refused and reported", "[instance]")
{
  _counts = {};
  test_host host;
  plugin_registry registry;
  register_stubs(registry);
  auto created = plugin_instance::create(host, test_host_info(), registry.factory(), "test.counting");
  REQUIRE(created.ok());
  auto raw = created.value()->as_raw();

  REQUIRE_FALSE(raw->start_processing(raw));
  REQUIRE_FALSE(raw->activate(raw, 0.0, 1, 256));
  REQUIRE_FALSE(raw->activate(raw, 48000.0, 512, 256));
  REQUIRE(_counts.start == 0);
  REQUIRE(_counts.activate == 0);
  REQUIRE(host.logged(log_severity::host_misbehaving));
}

TEST_CASE("destroy while processing stops before deactivating", "[instance]")
{
  _counts = {};
  test_host host;
  plugin_registry registry;
  register_stubs(registry);
  host_wrapper wrapper(host, test_host_info(), bridge_config());
  auto factory = registry.factory();
  auto raw = factory->create_plugin(factory, wrapper.as_raw(), "test.counting");
  REQUIRE(raw != nullptr);
  REQUIRE(raw->init(raw));
  REQUIRE(raw->activate(raw, 48000.0, 1, 256));
  REQUIRE(raw->start_processing(raw));

  raw->destroy(raw);
  REQUIRE(_counts.stop == 1);
  REQUIRE(_counts.deactivate == 1);
  REQUIRE(_counts.stopped_before_deactivate);
}

TEST_CASE("unchecked instances trust the host", "[instance]")
{
  _counts = {};
  test_host host;
  bridge_config config = { checking_level::None, misbehaviour_handler::Ignore };
  plugin_registry registry(config);
  register_stubs(registry);
  auto created = plugin_instance::create(host, test_host_info(), registry.factory(), "test.counting");
  REQUIRE(created.ok());
  auto raw = created.value()->as_raw();
  REQUIRE(raw->start_processing(raw));
  REQUIRE(_counts.start == 1);
  REQUIRE_FALSE(host.logged(log_severity::host_misbehaving));
}

TEST_CASE("exceptions do not cross the abi", "[instance]")
{
  test_host host;
  plugin_registry registry;
  register_stubs(registry);
  auto created = plugin_instance::create(host, test_host_info(), registry.factory(), "test.throwing");
  REQUIRE(created.ok());
  auto& instance = *created.value();
  REQUIRE(instance.activate(test_audio).ok());
  REQUIRE(instance.start_processing().ok());

  event_buffer in;
  event_buffer out;
  audio_port_buffers inputs;
  audio_port_buffers outputs;
  auto status = instance.process(inputs, outputs, in, out, 32);
  REQUIRE_FALSE(status.ok());
  REQUIRE(status.error() == instance_error::process_failed);
}

namespace {

static plugin_registry* _bundle_registry = nullptr;
static int _bundle_inits = 0;
static int _bundle_deinits = 0;

static bool CLAP_ABI
bundle_init(char const* path)
{
  _bundle_inits++;
  return std::string(path) != "refuse";
}

static void CLAP_ABI
bundle_deinit()
{ _bundle_deinits++; }

static void const* CLAP_ABI
bundle_get_factory(char const* factory_id)
{ return _bundle_registry->get_factory(factory_id); }

clap_plugin_entry
test_entry()
{
  clap_plugin_entry entry = {};
  entry.clap_version = CLAP_VERSION;
  entry.init = bundle_init;
  entry.deinit = bundle_deinit;
  entry.get_factory = bundle_get_factory;
  return entry;
}

}

TEST_CASE("bundle from a resolved entry", "[bundle]")
{
  plugin_registry registry;
  register_stubs(registry);
  _bundle_registry = &registry;
  _bundle_inits = 0;
  _bundle_deinits = 0;

  SECTION("null entry")
  {
    auto loaded = plugin_bundle::load_from_raw(nullptr, "none");
    REQUIRE(loaded.error() == bundle_error::null_entry);
  }

  SECTION("incompatible version")
  {
    auto entry = test_entry();
    entry.clap_version = { 0, 9, 0 };
    REQUIRE(plugin_bundle::load_from_raw(&entry, "old").error() == bundle_error::incompatible_version);
    REQUIRE(_bundle_inits == 0);
  }

  SECTION("init refused")
  {
    auto entry = test_entry();
    REQUIRE(plugin_bundle::load_from_raw(&entry, "refuse").error() == bundle_error::init_failed);
    REQUIRE(_bundle_deinits == 0);
  }

  SECTION("loaded")
  {
    auto entry = test_entry();
    {
      auto loaded = plugin_bundle::load_from_raw(&entry, "test.clap");
      REQUIRE(loaded.ok());
      auto& bundle = *loaded.value();
      REQUIRE(bundle.path() == "test.clap");
      REQUIRE(bundle.plugin_factory() == registry.factory());
      REQUIRE(bundle.descriptors().size() == 3);

      test_host host;
      auto created = plugin_instance::create(host, test_host_info(), bundle, "test.counting");
      REQUIRE(created.ok());
    }
    REQUIRE(_bundle_inits == 1);
    REQUIRE(_bundle_deinits == 1);
  }
}
