#pragma once

#include <string>
#include <cstring>
#include <cassert>
#include <cstdint>
#include <string_view>

#define PBRIDGE_PREVENT_ACCIDENTAL_COPY(x)  \
  x(x&&) = default;               \
  x& operator = (x&&) = default;  \
  explicit x(x const&) = default; \
  x& operator = (x const&) = delete

// objects the abi points back into
#define PBRIDGE_PIN_ADDRESS(x)    \
  x(x&&) = delete;                \
  x(x const&) = delete;           \
  x& operator = (x&&) = delete;   \
  x& operator = (x const&) = delete

#define PBRIDGE_STR_(x) #x
#define PBRIDGE_STR(x) PBRIDGE_STR_(x)
#define PBRIDGE_COMBINE_(x, y) x##y
#define PBRIDGE_COMBINE(x, y) PBRIDGE_COMBINE_(x, y)
#define PBRIDGE_VERSION_TEXT(major, minor, patch) PBRIDGE_STR(major.minor.patch)

namespace plugin_bridge {

inline bool
has_embedded_nul(std::string_view text)
{ return text.find('\0') != std::string_view::npos; }

inline bool
same_id(char const* l, char const* r)
{ return l != nullptr && r != nullptr && !strcmp(l, r); }

template <class T> std::string
to_8bit_string(T const* source)
{
  std::string result;
  if (source == nullptr) return result;
  T c = *source;
  while (c != static_cast<T>('\0'))
  {
    result += static_cast<char>(c);
    c = *++source;
  }
  return result;
}

// always terminates, truncates if needed
template <class T>
void from_8bit_string(T* dest, std::uint32_t count, char const* source)
{
  if (count == 0) return;
  memset(dest, 0, sizeof(*dest) * count);
  std::size_t length = strlen(source);
  for (std::uint32_t i = 0; i < count - 1 && i < length; i++)
    dest[i] = source[i];
}

template <class T, int N>
void from_8bit_string(T(&dest)[N], char const* source)
{ from_8bit_string(dest, N, source); }

}
