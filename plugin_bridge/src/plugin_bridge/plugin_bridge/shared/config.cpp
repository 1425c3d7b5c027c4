#include <plugin_bridge/shared/config.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <exception>

namespace plugin_bridge {

void
report_misbehaviour(bridge_config const& config, char const* func, std::string const& message)
{
  write_log(log_level::misbehaving, __FILE__, __LINE__, func, message);
  if (config.misbehaviour == misbehaviour_handler::Terminate)
    std::terminate();
}

}
