#pragma once

#include <plugin_bridge/events/event_view.hpp>
#include <plugin_bridge/shared/utility.hpp>

#include <clap/events.h>
#include <clap/helpers/event-list.hh>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <type_traits>

namespace plugin_bridge {

// Typed facade over a peer's input list. Records come in the order the
// producer submitted them, producers are expected to keep time non-decreasing.
class input_event_list final {
  clap_input_events const* _list;

public:
  // Null records are skipped, a well behaved peer has none below size().
  class iterator final {
    clap_input_events const* _list = nullptr;
    std::uint32_t _index = 0;
    std::uint32_t _size = 0;
    clap_event_header const* _current = nullptr;
    void settle();

  public:
    typedef std::ptrdiff_t difference_type;
    typedef event_view value_type;
    typedef event_view reference;
    typedef void pointer;
    typedef std::input_iterator_tag iterator_category;

    iterator() = default;
    iterator(clap_input_events const* list, std::uint32_t index, std::uint32_t size);

    event_view operator*() const { return event_view(_current); }
    iterator& operator++() { _index++; settle(); return *this; }
    iterator operator++(int) { iterator result(*this); ++*this; return result; }
    friend bool operator==(iterator const& l, iterator const& r) { return l._list == r._list && l._index == r._index; }
    friend bool operator!=(iterator const& l, iterator const& r) { return !(l == r); }
  };

  explicit input_event_list(clap_input_events const* list) : _list(list) { assert(list); }

  std::uint32_t size() const { return _list->size(_list); }
  bool empty() const { return size() == 0; }
  clap_input_events const* as_raw() const { return _list; }

  // peers answer null for out of range, so does this
  std::optional<event_view> get(std::uint32_t index) const;

  // each call starts over from the first record
  iterator begin() const { auto count = size(); return iterator(_list, 0, count); }
  iterator end() const { auto count = size(); return iterator(_list, count, count); }
};

// Typed facade over a peer's output list.
class output_event_list final {
  clap_output_events const* _list;

public:
  explicit output_event_list(clap_output_events const* list) : _list(list) { assert(list); }
  clap_output_events const* as_raw() const { return _list; }

  // false means the peer refused (e.g. out of space)
  bool try_push(clap_event_header const* header) const { return _list->try_push(_list, header); }
  bool try_push(event_view const& event) const { return try_push(event.as_raw()); }
  template <class E, class = std::enable_if_t<std::is_class_v<E>>>
  bool try_push(E const& event) const { return try_push(event.as_header()); }
};

// Append-only owned storage for variable size records on top of a
// clap-helpers event list. Usable by the peer as both an input and an
// output list. Never reorders, never merges.
class event_buffer final {
  ::clap::helpers::EventList _events;
  clap_input_events _input = {};
  clap_output_events _output = {};

  static std::uint32_t CLAP_ABI clap_size(clap_input_events const* list);
  static clap_event_header const* CLAP_ABI clap_get(clap_input_events const* list, std::uint32_t index);
  static bool CLAP_ABI clap_try_push(clap_output_events const* list, clap_event_header const* event);

public:
  static std::uint32_t constexpr max_event_size = 64 * 1024;

  PBRIDGE_PIN_ADDRESS(event_buffer);
  event_buffer();
  event_buffer(std::size_t event_capacity, std::size_t byte_capacity);

  // false for records that are malformed or too large
  bool push(clap_event_header const* header);
  template <class E, class = std::enable_if_t<std::is_class_v<E>>>
  bool push(E const& event) { return push(event.as_header()); }

  void clear() { _events.clear(); }
  std::size_t size() const { return _events.size(); }
  bool empty() const { return size() == 0; }
  clap_event_header const* get(std::size_t index) const;

  clap_input_events const* as_input() const { return &_input; }
  clap_output_events const* as_output() const { return &_output; }
  input_event_list input() const { return input_event_list(&_input); }
  output_event_list output() const { return output_event_list(&_output); }
};

}
