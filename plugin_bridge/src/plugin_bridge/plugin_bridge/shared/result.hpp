#pragma once

#include <variant>
#include <utility>
#include <cassert>
#include <optional>

namespace plugin_bridge {

// ok, or the single step that failed
template <class E>
class status final {
  std::optional<E> _error = {};

public:
  bool ok() const { return !_error.has_value(); }
  E error() const { assert(!ok()); return *_error; }
  std::optional<E> const& error_if_any() const { return _error; }

  status() = default;
  status(E error) : _error(error) {}
  status(status const&) = default;
  status& operator=(status const&) = default;
};

// value, or the single step that failed
template <class T, class E>
class result final {
  std::variant<T, E> _value;

public:
  bool ok() const { return _value.index() == 0; }
  T& value() { assert(ok()); return std::get<0>(_value); }
  T const& value() const { assert(ok()); return std::get<0>(_value); }
  E error() const { assert(!ok()); return std::get<1>(_value); }

  std::optional<T> to_optional() const
  { return ok() ? std::optional<T>(value()) : std::nullopt; }

  result(T value) : _value(std::in_place_index<0>, std::move(value)) {}
  result(E error) : _value(std::in_place_index<1>, error) {}
};

}
