#pragma once

#include <plugin_bridge/shared/utility.hpp>
#include <clap/audio-buffer.h>

#include <vector>
#include <cstdint>

namespace plugin_bridge {

// Host owned port list for one side of a process call.
// Channel memory belongs to the caller.
class audio_port_buffers final {
  std::vector<std::vector<float*>> _channels = {};
  std::vector<clap_audio_buffer> _buffers = {};

public:
  PBRIDGE_PIN_ADDRESS(audio_port_buffers);
  audio_port_buffers() = default;

  void clear();
  void add_port(std::vector<float*> const& channels, std::uint32_t latency = 0);

  bool empty() const { return _buffers.empty(); }
  std::uint32_t count() const { return static_cast<std::uint32_t>(_buffers.size()); }
  clap_audio_buffer* data() { return _buffers.empty() ? nullptr : _buffers.data(); }
};

}
