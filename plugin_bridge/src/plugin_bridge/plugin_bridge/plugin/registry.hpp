#pragma once

#include <plugin_bridge/plugin/plugin.hpp>
#include <plugin_bridge/plugin/descriptor.hpp>
#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/shared/utility.hpp>

#include <clap/host.h>
#include <clap/factory/plugin-factory.h>

#include <memory>
#include <vector>
#include <cstdint>

namespace plugin_bridge {

typedef std::unique_ptr<plugin> (*plugin_factory)();

// Explicit list of the plugins one binary exposes.
// Registries are independent, the factory table points back to its own.
class plugin_registry final {
  struct factory_table
  {
    clap_plugin_factory raw;
    plugin_registry* registry;
  };

  struct registration
  {
    std::unique_ptr<plugin_descriptor> descriptor;
    plugin_factory factory;
  };

  factory_table _factory = {};
  bridge_config const _config;
  std::vector<registration> _plugins = {};

  static plugin_registry* from_raw(clap_plugin_factory const* factory);
  static std::uint32_t CLAP_ABI clap_get_plugin_count(clap_plugin_factory const* factory);
  static clap_plugin_descriptor const* CLAP_ABI clap_get_plugin_descriptor(clap_plugin_factory const* factory, std::uint32_t index);
  static clap_plugin const* CLAP_ABI clap_create_plugin(clap_plugin_factory const* factory, clap_host const* host, char const* plugin_id);

public:
  PBRIDGE_PIN_ADDRESS(plugin_registry);
  explicit plugin_registry(bridge_config const& config = {});

  // false when the id is already taken
  bool add(plugin_descriptor_info const& info, plugin_factory factory);

  std::uint32_t count() const { return static_cast<std::uint32_t>(_plugins.size()); }
  plugin_descriptor const* descriptor(std::uint32_t index) const;
  plugin_descriptor const* find(char const* plugin_id) const;

  // null for unknown ids, ids are compared byte for byte
  clap_plugin const* create(clap_host const* host, char const* plugin_id) const;

  clap_plugin_factory const* factory() const { return &_factory.raw; }
  void const* get_factory(char const* factory_id) const;
};

}
