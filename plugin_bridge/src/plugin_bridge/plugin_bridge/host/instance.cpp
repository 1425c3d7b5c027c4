#include <plugin_bridge/host/instance.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <clap/process.h>

namespace plugin_bridge {

char const*
instance_error_text(instance_error error)
{
  switch (error)
  {
  case instance_error::plugin_not_found: return "No plugin with the requested id.";
  case instance_error::creation_failed: return "Plugin factory failed to create the plugin.";
  case instance_error::init_failed: return "Plugin failed to initialize.";
  case instance_error::activation_failed: return "Plugin failed to activate.";
  case instance_error::already_activated: return "Plugin is already active.";
  case instance_error::not_activated: return "Plugin is not active.";
  case instance_error::start_processing_failed: return "Plugin failed to start processing.";
  case instance_error::not_processing: return "Plugin is not processing.";
  case instance_error::process_failed: return "Plugin failed to process.";
  default: return "Unknown instance error.";
  }
}

static bool
factory_has_plugin(clap_plugin_factory const* factory, char const* plugin_id)
{
  if (factory->get_plugin_count == nullptr || factory->get_plugin_descriptor == nullptr) return false;
  std::uint32_t count = factory->get_plugin_count(factory);
  for (std::uint32_t i = 0; i < count; i++)
  {
    auto desc = factory->get_plugin_descriptor(factory, i);
    if (desc != nullptr && same_id(desc->id, plugin_id)) return true;
  }
  return false;
}

plugin_instance::
plugin_instance(host& host, host_info const& info, bridge_config const& config):
_host(host, info, config), _config(config), _main_thread(std::this_thread::get_id()) {}

plugin_instance::
~plugin_instance()
{
  if (_plugin == nullptr) return;
  if (_processing && _plugin->stop_processing != nullptr)
    _plugin->stop_processing(_plugin);
  if (_active && _plugin->deactivate != nullptr)
    _plugin->deactivate(_plugin);
  if (_plugin->destroy != nullptr)
    _plugin->destroy(_plugin);
}

result<std::unique_ptr<plugin_instance>, instance_error>
plugin_instance::create(
  host& host, host_info const& info, plugin_bundle const& bundle,
  char const* plugin_id, bridge_config const& config)
{ return create(host, info, bundle.plugin_factory(), plugin_id, config); }

result<std::unique_ptr<plugin_instance>, instance_error>
plugin_instance::create(
  host& host, host_info const& info, clap_plugin_factory const* factory,
  char const* plugin_id, bridge_config const& config)
{
  PBRIDGE_LOG_FUNC_ENTRY_EXIT();
  if (factory == nullptr || plugin_id == nullptr || !factory_has_plugin(factory, plugin_id))
    return instance_error::plugin_not_found;
  if (factory->create_plugin == nullptr)
    return instance_error::creation_failed;

  std::unique_ptr<plugin_instance> instance(new plugin_instance(host, info, config));
  instance->_plugin = factory->create_plugin(factory, instance->_host.as_raw(), plugin_id);
  if (instance->_plugin == nullptr)
  {
    PBRIDGE_WRITE_LOG(std::string("Failed to create plugin ") + plugin_id + ".");
    return instance_error::creation_failed;
  }
  if (instance->_plugin->init == nullptr || !instance->_plugin->init(instance->_plugin))
  {
    PBRIDGE_WRITE_LOG(std::string("Failed to initialize plugin ") + plugin_id + ".");
    return instance_error::init_failed;
  }
  return instance;
}

void
plugin_instance::check_main_thread(char const* func) const
{
  if (_config.checks_threads() && std::this_thread::get_id() != _main_thread)
    report_misbehaviour(_config, func, "Main thread call made from another thread.");
}

void
plugin_instance::check_audio_thread(char const* func) const
{
  // offline and single threaded hosts process on the main thread
  if (!_config.checks_threads()) return;
  if (std::this_thread::get_id() == _main_thread) return;
  if (_audio_thread && std::this_thread::get_id() != *_audio_thread)
    report_misbehaviour(_config, func, "Audio thread call made from another thread.");
}

status<instance_error>
plugin_instance::activate(audio_configuration const& config)
{
  check_main_thread(__func__);
  if (_active) return instance_error::already_activated;
  if (!_plugin->activate(_plugin, config.sample_rate, config.min_frames_count, config.max_frames_count))
    return instance_error::activation_failed;
  _active = true;
  return {};
}

// stops processing first when needed
status<instance_error>
plugin_instance::deactivate()
{
  check_main_thread(__func__);
  if (!_active) return instance_error::not_activated;
  if (_processing)
  {
    _plugin->stop_processing(_plugin);
    _processing = false;
  }
  _plugin->deactivate(_plugin);
  _audio_thread.reset();
  _active = false;
  return {};
}

void
plugin_instance::on_main_thread()
{
  check_main_thread(__func__);
  _plugin->on_main_thread(_plugin);
}

status<instance_error>
plugin_instance::start_processing()
{
  if (!_active) return instance_error::not_activated;
  if (_processing) return {};
  _audio_thread = std::this_thread::get_id();
  if (!_plugin->start_processing(_plugin))
    return instance_error::start_processing_failed;
  _processing = true;
  return {};
}

status<instance_error>
plugin_instance::stop_processing()
{
  check_audio_thread(__func__);
  if (!_processing) return instance_error::not_processing;
  _plugin->stop_processing(_plugin);
  _processing = false;
  return {};
}

status<instance_error>
plugin_instance::reset()
{
  check_audio_thread(__func__);
  if (!_active) return instance_error::not_activated;
  _plugin->reset(_plugin);
  return {};
}

result<process_status, instance_error>
plugin_instance::process(
  audio_port_buffers& inputs, audio_port_buffers& outputs,
  event_buffer const& in_events, event_buffer& out_events,
  std::uint32_t frames_count, std::int64_t steady_time,
  transport_event const* transport)
{
  check_audio_thread(__func__);
  if (!_processing) return instance_error::not_processing;

  clap_process process = {};
  process.steady_time = steady_time;
  process.frames_count = frames_count;
  process.transport = transport == nullptr ? nullptr : &transport->as_raw();
  process.audio_inputs = inputs.data();
  process.audio_outputs = outputs.data();
  process.audio_inputs_count = inputs.count();
  process.audio_outputs_count = outputs.count();
  process.in_events = in_events.as_input();
  process.out_events = out_events.as_output();

  clap_process_status status = _plugin->process(_plugin, &process);
  switch (status)
  {
  case CLAP_PROCESS_CONTINUE: return process_status::continue_;
  case CLAP_PROCESS_CONTINUE_IF_NOT_QUIET: return process_status::continue_if_not_quiet;
  case CLAP_PROCESS_TAIL: return process_status::tail;
  case CLAP_PROCESS_SLEEP: return process_status::sleep;
  default: return instance_error::process_failed;
  }
}

}
