#pragma once

#include <plugin_bridge/shared/utility.hpp>
#include <clap/plugin.h>

#include <string>
#include <vector>

namespace plugin_bridge {

struct plugin_descriptor_info
{
  std::string id;
  std::string name;
  std::string vendor;
  std::string url;
  std::string manual_url;
  std::string support_url;
  std::string version;
  std::string description;
  std::vector<std::string> features;
};

// Owns the strings a clap_plugin_descriptor points into.
class plugin_descriptor final {
  plugin_descriptor_info const _info;
  std::vector<char const*> _features = {};
  clap_plugin_descriptor _raw = {};

public:
  PBRIDGE_PIN_ADDRESS(plugin_descriptor);
  explicit plugin_descriptor(plugin_descriptor_info const& info);

  plugin_descriptor_info const& info() const { return _info; }
  clap_plugin_descriptor const* as_raw() const { return &_raw; }
};

}
