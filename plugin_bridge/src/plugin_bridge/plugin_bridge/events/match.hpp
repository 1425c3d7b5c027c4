#pragma once

#include <cstdint>
#include <optional>
#include <type_traits>

namespace plugin_bridge {

// Either one specific value, or a wildcard matching any value in the domain.
// On the wire the wildcard is -1 in a signed field of the same width.
template <class T>
class match final {
  static_assert(
    std::is_same_v<T, std::uint16_t> || std::is_same_v<T, std::uint32_t>,
    "match is defined for 16 and 32 bit unsigned domains only");

public:
  typedef T value_type;
  typedef std::conditional_t<std::is_same_v<T, std::uint16_t>, std::int16_t, std::int32_t> raw_type;

private:
  bool _all = true;
  T _value = {};

  constexpr match(bool all, T value) : _all(all), _value(value) {}

public:
  constexpr match() = default;
  constexpr match(T value) : _all(false), _value(value) {}

  static constexpr match all() { return match(true, T{}); }
  static constexpr match specific(T value) { return match(false, value); }

  constexpr bool is_all() const { return _all; }
  constexpr bool is_specific() const { return !_all; }
  constexpr T value_or(T fallback) const { return _all ? fallback : _value; }
  constexpr std::optional<T> value() const
  { return _all ? std::nullopt : std::optional<T>(_value); }

  // refinement: a wildcard on either side matches
  constexpr bool matches(match const& other) const
  { return _all || other._all || _value == other._value; }

  // any negative value is a wildcard, not only -1
  static constexpr match from_raw(raw_type raw)
  { return raw < 0 ? all() : specific(static_cast<T>(raw)); }

  constexpr raw_type to_raw() const
  { return _all ? static_cast<raw_type>(-1) : static_cast<raw_type>(_value); }

  friend constexpr bool operator==(match const& l, match const& r)
  { return l._all == r._all && (l._all || l._value == r._value); }
  friend constexpr bool operator!=(match const& l, match const& r)
  { return !(l == r); }
};

typedef match<std::uint16_t> match16;
typedef match<std::uint32_t> match32;

}
