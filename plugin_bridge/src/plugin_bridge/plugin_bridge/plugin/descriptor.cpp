#include <plugin_bridge/plugin/descriptor.hpp>
#include <clap/version.h>

#include <cassert>

namespace plugin_bridge {

plugin_descriptor::
plugin_descriptor(plugin_descriptor_info const& info):
_info(info)
{
  assert(!_info.id.empty());
  for (auto const& f : _info.features)
    _features.push_back(f.c_str());
  _features.push_back(nullptr);

  _raw.clap_version = CLAP_VERSION;
  _raw.id = _info.id.c_str();
  _raw.name = _info.name.c_str();
  _raw.vendor = _info.vendor.c_str();
  _raw.url = _info.url.c_str();
  _raw.manual_url = _info.manual_url.c_str();
  _raw.support_url = _info.support_url.c_str();
  _raw.version = _info.version.c_str();
  _raw.description = _info.description.c_str();
  _raw.features = _features.data();
}

}
