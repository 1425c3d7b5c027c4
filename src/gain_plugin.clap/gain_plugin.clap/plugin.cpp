#include <gain_plugin/plugin.hpp>
#include <plugin_bridge/shared/logger.hpp>
#include <plugin_bridge/plugin/registry.hpp>

#include <clap/clap.h>
#include <memory>

using namespace plugin_bridge;
using namespace gain_plugin;

static std::unique_ptr<plugin_registry> _registry = {};

static void CLAP_ABI
deinit()
{
  PBRIDGE_LOG_FUNC_ENTRY_EXIT();
  _registry.reset();
  cleanup_logging();
}

static bool CLAP_ABI
init(char const*)
{
  init_logging(GAIN_PLUGIN_VENDOR_NAME, GAIN_PLUGIN_FULL_NAME);
  PBRIDGE_LOG_FUNC_ENTRY_EXIT();
  _registry = std::make_unique<plugin_registry>(bridge_config {
    .checking = checking_level::Maximal,
    .misbehaviour = misbehaviour_handler::Ignore });
  return register_gain_plugin(*_registry);
}

static void const* CLAP_ABI
get_factory(char const* factory_id)
{
  if (!_registry) return nullptr;
  return _registry->get_factory(factory_id);
}

extern "C" CLAP_EXPORT
clap_plugin_entry_t const clap_entry =
{
  .clap_version = CLAP_VERSION_INIT,
  .init = init,
  .deinit = deinit,
  .get_factory = get_factory
};
