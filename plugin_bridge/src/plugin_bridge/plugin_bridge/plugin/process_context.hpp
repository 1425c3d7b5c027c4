#pragma once

#include <plugin_bridge/events/event_list.hpp>
#include <plugin_bridge/events/event_types.hpp>

#include <clap/process.h>
#include <clap/audio-buffer.h>

#include <cstdint>
#include <optional>

namespace plugin_bridge {

enum class process_status : std::int32_t {
  continue_ = CLAP_PROCESS_CONTINUE,
  continue_if_not_quiet = CLAP_PROCESS_CONTINUE_IF_NOT_QUIET,
  tail = CLAP_PROCESS_TAIL,
  sleep = CLAP_PROCESS_SLEEP };

// One audio port of one block. Either 32 or 64 bit channels are present.
class audio_port_view final {
  clap_audio_buffer const* _buffer;
  std::uint32_t _frames;

public:
  audio_port_view(clap_audio_buffer const* buffer, std::uint32_t frames):
  _buffer(buffer), _frames(frames) { assert(buffer); }

  std::uint32_t frames() const { return _frames; }
  std::uint32_t latency() const { return _buffer->latency; }
  std::uint64_t constant_mask() const { return _buffer->constant_mask; }
  std::uint32_t channel_count() const { return _buffer->channel_count; }
  bool is_64bit() const { return _buffer->data32 == nullptr && _buffer->data64 != nullptr; }

  // null when out of range or the other width is in use
  float* channel32(std::uint32_t index) const;
  double* channel64(std::uint32_t index) const;
};

// Everything the plugin sees of one process call.
class process_context final {
  clap_process const* _process;
  input_event_list _in;
  output_event_list _out;

public:
  PBRIDGE_PIN_ADDRESS(process_context);
  explicit process_context(clap_process const* process);

  clap_process const* as_raw() const { return _process; }
  std::uint32_t frames_count() const { return _process->frames_count; }

  // empty when the host does not provide one
  std::optional<std::int64_t> steady_time() const;
  std::optional<transport_event> transport() const;

  std::uint32_t audio_input_count() const { return _process->audio_inputs_count; }
  std::uint32_t audio_output_count() const { return _process->audio_outputs_count; }
  audio_port_view audio_input(std::uint32_t index) const;
  audio_port_view audio_output(std::uint32_t index) const;

  input_event_list const& in_events() const { return _in; }
  output_event_list const& out_events() const { return _out; }
};

}
