#include <plugin_bridge/plugin/process_context.hpp>

namespace plugin_bridge {

float*
audio_port_view::channel32(std::uint32_t index) const
{
  if (_buffer->data32 == nullptr || index >= _buffer->channel_count) return nullptr;
  return _buffer->data32[index];
}

double*
audio_port_view::channel64(std::uint32_t index) const
{
  if (_buffer->data64 == nullptr || index >= _buffer->channel_count) return nullptr;
  return _buffer->data64[index];
}

process_context::
process_context(clap_process const* process):
_process(process), _in(process->in_events), _out(process->out_events) {}

std::optional<std::int64_t>
process_context::steady_time() const
{
  if (_process->steady_time < 0) return std::nullopt;
  return _process->steady_time;
}

std::optional<transport_event>
process_context::transport() const
{
  if (_process->transport == nullptr) return std::nullopt;
  return transport_event::from_raw(*_process->transport).to_optional();
}

audio_port_view
process_context::audio_input(std::uint32_t index) const
{
  assert(index < _process->audio_inputs_count);
  return audio_port_view(&_process->audio_inputs[index], _process->frames_count);
}

audio_port_view
process_context::audio_output(std::uint32_t index) const
{
  assert(index < _process->audio_outputs_count);
  return audio_port_view(&_process->audio_outputs[index], _process->frames_count);
}

}
