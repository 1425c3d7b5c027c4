#include <plugin_bridge/plugin/registry.hpp>
#include <plugin_bridge/plugin/wrapper.hpp>
#include <plugin_bridge/shared/boundary.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <cstddef>

namespace plugin_bridge {

plugin_registry::
plugin_registry(bridge_config const& config):
_config(config)
{
  static_assert(offsetof(factory_table, raw) == 0);
  _factory.registry = this;
  _factory.raw.get_plugin_count = clap_get_plugin_count;
  _factory.raw.get_plugin_descriptor = clap_get_plugin_descriptor;
  _factory.raw.create_plugin = clap_create_plugin;
}

bool
plugin_registry::add(plugin_descriptor_info const& info, plugin_factory factory)
{
  assert(factory);
  if (find(info.id.c_str()) != nullptr)
  {
    PBRIDGE_WRITE_LOG("Plugin id registered twice: " + info.id + ".");
    return false;
  }
  _plugins.push_back({ std::make_unique<plugin_descriptor>(info), factory });
  return true;
}

plugin_descriptor const*
plugin_registry::descriptor(std::uint32_t index) const
{
  if (index >= _plugins.size()) return nullptr;
  return _plugins[index].descriptor.get();
}

plugin_descriptor const*
plugin_registry::find(char const* plugin_id) const
{
  for (auto const& p : _plugins)
    if (same_id(p.descriptor->as_raw()->id, plugin_id))
      return p.descriptor.get();
  return nullptr;
}

clap_plugin const*
plugin_registry::create(clap_host const* host, char const* plugin_id) const
{
  if (host == nullptr) return nullptr;
  for (auto const& p : _plugins)
  {
    if (!same_id(p.descriptor->as_raw()->id, plugin_id)) continue;
    auto instance = p.factory();
    if (!instance)
    {
      PBRIDGE_WRITE_LOG(std::string("Plugin factory returned nothing for ") + plugin_id + ".");
      return nullptr;
    }
    return create_plugin_wrapper(p.descriptor->as_raw(), host, std::move(instance), _config);
  }
  return nullptr;
}

void const*
plugin_registry::get_factory(char const* factory_id) const
{
  if (!same_id(factory_id, CLAP_PLUGIN_FACTORY_ID)) return nullptr;
  return &_factory.raw;
}

plugin_registry*
plugin_registry::from_raw(clap_plugin_factory const* factory)
{
  if (factory == nullptr) return nullptr;
  return reinterpret_cast<factory_table const*>(factory)->registry;
}

std::uint32_t CLAP_ABI
plugin_registry::clap_get_plugin_count(clap_plugin_factory const* factory)
{
  return guard_boundary(__func__, 0u, [factory]() -> std::uint32_t {
    auto registry = from_raw(factory);
    return registry == nullptr ? 0 : registry->count();
  });
}

clap_plugin_descriptor const* CLAP_ABI
plugin_registry::clap_get_plugin_descriptor(clap_plugin_factory const* factory, std::uint32_t index)
{
  return guard_boundary(__func__, static_cast<clap_plugin_descriptor const*>(nullptr), [factory, index]() -> clap_plugin_descriptor const* {
    auto registry = from_raw(factory);
    if (registry == nullptr) return nullptr;
    auto result = registry->descriptor(index);
    return result == nullptr ? nullptr : result->as_raw();
  });
}

clap_plugin const* CLAP_ABI
plugin_registry::clap_create_plugin(clap_plugin_factory const* factory, clap_host const* host, char const* plugin_id)
{
  return guard_boundary(__func__, static_cast<clap_plugin const*>(nullptr), [factory, host, plugin_id]() -> clap_plugin const* {
    auto registry = from_raw(factory);
    if (registry == nullptr) return nullptr;
    return registry->create(host, plugin_id);
  });
}

}
