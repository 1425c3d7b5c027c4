#include <plugin_bridge/host/bundle.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <clap/version.h>

namespace plugin_bridge {

char const*
bundle_error_text(bundle_error error)
{
  switch (error)
  {
  case bundle_error::null_entry: return "Bundle entry is missing.";
  case bundle_error::incompatible_version: return "Bundle was built against an incompatible clap version.";
  case bundle_error::init_failed: return "Bundle entry failed to initialize.";
  default: return "Unknown bundle error.";
  }
}

plugin_bundle::
plugin_bundle(clap_plugin_entry const* entry, std::string const& path):
_entry(entry), _path(path) {}

plugin_bundle::
~plugin_bundle()
{
  if (_entry->deinit != nullptr)
    _entry->deinit();
}

result<std::unique_ptr<plugin_bundle>, bundle_error>
plugin_bundle::load_from_raw(clap_plugin_entry const* entry, std::string const& path)
{
  if (entry == nullptr || entry->init == nullptr || entry->get_factory == nullptr)
    return bundle_error::null_entry;
  if (!clap_version_is_compatible(entry->clap_version))
  {
    PBRIDGE_WRITE_LOG("Incompatible bundle version at " + path + ".");
    return bundle_error::incompatible_version;
  }
  if (!entry->init(path.c_str()))
  {
    PBRIDGE_WRITE_LOG("Bundle init failed for " + path + ".");
    return bundle_error::init_failed;
  }
  return std::unique_ptr<plugin_bundle>(new plugin_bundle(entry, path));
}

void const*
plugin_bundle::get_factory(char const* factory_id) const
{
  if (factory_id == nullptr) return nullptr;
  return _entry->get_factory(factory_id);
}

clap_plugin_factory const*
plugin_bundle::plugin_factory() const
{ return static_cast<clap_plugin_factory const*>(get_factory(CLAP_PLUGIN_FACTORY_ID)); }

std::vector<clap_plugin_descriptor const*>
plugin_bundle::descriptors() const
{
  std::vector<clap_plugin_descriptor const*> result;
  auto factory = plugin_factory();
  if (factory == nullptr || factory->get_plugin_count == nullptr || factory->get_plugin_descriptor == nullptr) return result;
  std::uint32_t count = factory->get_plugin_count(factory);
  for (std::uint32_t i = 0; i < count; i++)
    if (auto desc = factory->get_plugin_descriptor(factory, i))
      result.push_back(desc);
  return result;
}

}
