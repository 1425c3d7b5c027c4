#include <plugin_bridge/host/audio_buffers.hpp>

namespace plugin_bridge {

void
audio_port_buffers::clear()
{
  _channels.clear();
  _buffers.clear();
}

void
audio_port_buffers::add_port(std::vector<float*> const& channels, std::uint32_t latency)
{
  _channels.push_back(channels);
  clap_audio_buffer buffer = {};
  buffer.latency = latency;
  buffer.channel_count = static_cast<std::uint32_t>(channels.size());
  _buffers.push_back(buffer);

  // pointer tables may have moved
  for (std::size_t i = 0; i < _buffers.size(); i++)
    _buffers[i].data32 = _channels[i].empty() ? nullptr : _channels[i].data();
}

}
