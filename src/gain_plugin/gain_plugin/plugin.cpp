#include <gain_plugin/plugin.hpp>
#include <plugin_bridge/plugin/host_proxy.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <clap/plugin-features.h>

#include <cmath>
#include <charconv>
#include <algorithm>

using namespace plugin_bridge;

namespace gain_plugin {

std::optional<note_port_info>
gain_note_ports::get(host_main_thread_handle const& host, std::uint32_t index, bool is_input)
{
  if (!is_input || index != 0) return std::nullopt;
  return note_port_info { 0, note_dialect_clap | note_dialect_midi, note_dialect_clap, "Notes" };
}

gain::
gain():
_to_main(std::make_unique<gain_queue>(gain_queue_size)) {}

status<plugin_error>
gain::init(host_main_thread_handle const& host)
{
  _log = host.extension<host_log>();
  if (_log && !_log->log_str(host, log_severity::info, GAIN_PLUGIN_FULL_NAME " initialized.").ok())
    PBRIDGE_WRITE_LOG("Failed to log to host.");
  return {};
}

void
gain::declare_extensions(extension_declarations& declarations)
{
  declarations.add<plugin_params_impl>(*this);
  declarations.add<plugin_audio_ports_impl>(*this);
  declarations.add<plugin_note_ports_impl>(_note_ports);
}

status<plugin_error>
gain::activate(host_main_thread_handle const& host, audio_configuration const& config)
{
  _audio_gain = _main_gain;
  return {};
}

status<plugin_error>
gain::start_processing(host_audio_thread_handle const& host)
{
  _processing = true;
  return {};
}

// Pull in values from audio->main.
void
gain::on_main_thread(host_main_thread_handle const& host)
{
  double value;
  while (_to_main->try_dequeue(value))
    _main_gain = value;
}

void
gain::push_to_main(host_handle const& host, double value)
{
  if (!_to_main->try_enqueue(value))
    return;
  host.request_callback();
}

// true when the event was a gain change
bool
gain::apply_param_event(event_view const& event)
{
  auto param = event.as<param_value_event>();
  if (!param || param->param_id() != gain_param_id) return false;
  _audio_gain = std::clamp(param->value(), gain_min, gain_max);
  return true;
}

result<process_status, plugin_error>
gain::process(host_audio_thread_handle const& host, process_context const& context)
{
  if (context.audio_input_count() == 0 || context.audio_output_count() == 0)
    return plugin_error::process;
  auto input = context.audio_input(0);
  auto output = context.audio_output(0);
  if (output.is_64bit()) return plugin_error::process;

  std::uint32_t frame = 0;
  std::uint32_t frames = context.frames_count();
  auto render = [&](std::uint32_t until) {
    until = std::min(until, frames);
    for (std::uint32_t c = 0; c < output.channel_count(); c++)
    {
      float* out = output.channel32(c);
      float const* in = input.channel32(c);
      if (out == nullptr) continue;
      for (std::uint32_t f = frame; f < until; f++)
        out[f] = in == nullptr ? 0.0f : static_cast<float>(in[f] * _audio_gain);
    }
    frame = std::max(frame, until);
  };

  bool gain_changed = false;
  for (auto event : context.in_events())
  {
    render(event.time());
    gain_changed |= apply_param_event(event);
    auto note_on = event.as<note_on_event>();
    bool pushed = note_on
      ? context.out_events().try_push(note_on->with_velocity(note_on->velocity() * 2.0))
      : context.out_events().try_push(event);
    if (!pushed) PBRIDGE_WRITE_LOG("Host refused output event.");
  }
  render(frames);

  if (gain_changed) push_to_main(host, _audio_gain);
  return process_status::continue_if_not_quiet;
}

std::optional<param_info>
gain::get_info(host_main_thread_handle const& host, std::uint32_t index)
{
  if (index != 0) return std::nullopt;
  return param_info {
    .id = gain_param_id,
    .flags = CLAP_PARAM_IS_STEPPED | CLAP_PARAM_IS_AUTOMATABLE,
    .cookie = nullptr,
    .name = "Gain",
    .module = "gain/gain",
    .min_value = gain_min,
    .max_value = gain_max,
    .default_value = gain_default };
}

std::optional<double>
gain::get_value(host_main_thread_handle const& host, clap_id param_id)
{
  if (param_id != gain_param_id) return std::nullopt;
  return _main_gain;
}

std::optional<std::string>
gain::value_to_text(host_main_thread_handle const& host, clap_id param_id, double value)
{
  if (param_id != gain_param_id) return std::nullopt;
  return std::to_string(static_cast<std::uint32_t>(std::clamp(value, gain_min, gain_max))) + " x";
}

std::optional<double>
gain::text_to_value(host_main_thread_handle const& host, clap_id param_id, std::string_view text)
{
  if (param_id != gain_param_id) return std::nullopt;
  std::uint32_t value = 0;
  auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
  if (parsed.ec != std::errc() || value > gain_max) return std::nullopt;
  return static_cast<double>(value);
}

// Main thread while inactive, audio thread otherwise.
void
gain::flush(host_handle const& host, input_event_list const& in, output_event_list const& out)
{
  bool gain_changed = false;
  for (auto event : in)
    gain_changed |= apply_param_event(event);
  if (!gain_changed) return;
  if (!_processing) _main_gain = _audio_gain;
  else push_to_main(host, _audio_gain);
}

std::uint32_t
gain::count(host_main_thread_handle const& host, bool is_input)
{ return 1; }

std::optional<audio_port_info>
gain::get(host_main_thread_handle const& host, std::uint32_t index, bool is_input)
{
  if (index != 0) return std::nullopt;
  return audio_port_info {
    .id = 0,
    .name = is_input ? "Input" : "Output",
    .flags = CLAP_AUDIO_PORT_IS_MAIN,
    .channel_count = 2,
    .port_type = CLAP_PORT_STEREO,
    .in_place_pair = 0 };
}

plugin_descriptor_info
gain_descriptor()
{
  return plugin_descriptor_info {
    .id = GAIN_PLUGIN_ID,
    .name = GAIN_PLUGIN_FULL_NAME,
    .vendor = GAIN_PLUGIN_VENDOR_NAME,
    .url = GAIN_PLUGIN_VENDOR_URL,
    .manual_url = GAIN_PLUGIN_VENDOR_URL,
    .support_url = GAIN_PLUGIN_VENDOR_URL,
    .version = GAIN_PLUGIN_VERSION_TEXT,
    .description = GAIN_PLUGIN_FULL_NAME,
    .features = { CLAP_PLUGIN_FEATURE_AUDIO_EFFECT, CLAP_PLUGIN_FEATURE_UTILITY, CLAP_PLUGIN_FEATURE_STEREO } };
}

bool
register_gain_plugin(plugin_registry& registry)
{
  return registry.add(gain_descriptor(), []() -> std::unique_ptr<plugin> {
    return std::make_unique<gain>();
  });
}

}
