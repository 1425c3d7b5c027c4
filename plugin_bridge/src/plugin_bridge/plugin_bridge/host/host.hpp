#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <string>

namespace plugin_bridge {

// identity the host presents to every plugin it loads
struct host_info
{
  std::string name;
  std::string vendor;
  std::string url;
  std::string version;
};

// Host side implementation. Request calls arrive on any thread
// and only ask for something to happen later on the host's terms.
class host {
public:
  virtual ~host() = default;
  virtual void request_restart() = 0;
  virtual void request_process() = 0;
  virtual void request_callback() = 0;

  // main thread, once per instance, before the plugin's init
  virtual void declare_extensions(extension_declarations& declarations) {}
};

}
