#pragma once

#include <plugin_bridge/shared/result.hpp>
#include <plugin_bridge/shared/utility.hpp>

#include <clap/entry.h>
#include <clap/factory/plugin-factory.h>

#include <memory>
#include <string>
#include <vector>

namespace plugin_bridge {

enum class bundle_error { null_entry, incompatible_version, init_failed };
char const* bundle_error_text(bundle_error error);

// An already resolved entry point, initialized for as long as this lives.
// Loading the binary and finding the symbol is up to the caller.
class plugin_bundle final {
  clap_plugin_entry const* const _entry;
  std::string const _path;
  plugin_bundle(clap_plugin_entry const* entry, std::string const& path);

public:
  PBRIDGE_PIN_ADDRESS(plugin_bundle);
  ~plugin_bundle();

  static result<std::unique_ptr<plugin_bundle>, bundle_error>
  load_from_raw(clap_plugin_entry const* entry, std::string const& path);

  std::string const& path() const { return _path; }
  clap_version version() const { return _entry->clap_version; }
  clap_plugin_entry const* as_raw() const { return _entry; }

  // null when the bundle does not provide one
  void const* get_factory(char const* factory_id) const;
  clap_plugin_factory const* plugin_factory() const;
  std::vector<clap_plugin_descriptor const*> descriptors() const;
};

}
