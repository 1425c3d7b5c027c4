#include <plugin_bridge/events/event_list.hpp>
#include <plugin_bridge/shared/boundary.hpp>

namespace plugin_bridge {

input_event_list::iterator::
iterator(clap_input_events const* list, std::uint32_t index, std::uint32_t size):
_list(list), _index(index), _size(size)
{ settle(); }

void
input_event_list::iterator::settle()
{
  _current = nullptr;
  for (; _index < _size; _index++)
    if ((_current = _list->get(_list, _index)) != nullptr)
      return;
}

std::optional<event_view>
input_event_list::get(std::uint32_t index) const
{
  auto header = _list->get(_list, index);
  if (header == nullptr) return std::nullopt;
  return event_view(header);
}

event_buffer::
event_buffer():
event_buffer(128, 4096) {}

event_buffer::
event_buffer(std::size_t event_capacity, std::size_t byte_capacity):
_events(
  static_cast<std::uint32_t>(byte_capacity),
  static_cast<std::uint32_t>(event_capacity), max_event_size)
{
  _input.ctx = this;
  _input.size = clap_size;
  _input.get = clap_get;
  _output.ctx = this;
  _output.try_push = clap_try_push;
}

bool
event_buffer::push(clap_event_header const* header)
{
  if (header == nullptr) return false;
  if (header->size < sizeof(clap_event_header)) return false;
  if (header->size > max_event_size) return false;
  _events.push(header);
  return true;
}

clap_event_header const*
event_buffer::get(std::size_t index) const
{
  if (index >= size()) return nullptr;
  return _events.get(static_cast<std::uint32_t>(index));
}

std::uint32_t CLAP_ABI
event_buffer::clap_size(clap_input_events const* list)
{
  return guard_boundary(__func__, 0u, [list]() -> std::uint32_t {
    if (list == nullptr || list->ctx == nullptr) return 0;
    return static_cast<std::uint32_t>(static_cast<event_buffer const*>(list->ctx)->size());
  });
}

clap_event_header const* CLAP_ABI
event_buffer::clap_get(clap_input_events const* list, std::uint32_t index)
{
  return guard_boundary(__func__, static_cast<clap_event_header const*>(nullptr), [list, index]() {
    if (list == nullptr || list->ctx == nullptr) return static_cast<clap_event_header const*>(nullptr);
    return static_cast<event_buffer const*>(list->ctx)->get(index);
  });
}

bool CLAP_ABI
event_buffer::clap_try_push(clap_output_events const* list, clap_event_header const* event)
{
  return guard_boundary(__func__, false, [list, event]() {
    if (list == nullptr || list->ctx == nullptr) return false;
    return static_cast<event_buffer*>(list->ctx)->push(event);
  });
}

}
