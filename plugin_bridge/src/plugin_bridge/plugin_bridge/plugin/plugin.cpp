#include <plugin_bridge/plugin/plugin.hpp>

namespace plugin_bridge {

char const*
plugin_error_text(plugin_error error)
{
  switch (error)
  {
  case plugin_error::init: return "Plugin failed to initialize.";
  case plugin_error::activate: return "Plugin failed to activate.";
  case plugin_error::start_processing: return "Plugin failed to start processing.";
  case plugin_error::process: return "Plugin failed to process.";
  default: return "Unknown plugin error.";
  }
}

}
