#pragma once

#include <plugin_bridge/shared/logger.hpp>

#include <exception>
#include <type_traits>

namespace plugin_bridge {

// Logging itself may throw (allocation, file io), that
// must not escape the noexcept guards either.
inline void
log_boundary_exception(char const* func, char const* what) noexcept
{
  try
  {
    write_log(log_level::error, __FILE__, __LINE__, func,
      std::string("Exception at abi boundary: ") + (what != nullptr ? what : "unknown") + ".");
  }
  catch (...)
  {
    // nowhere left to report to
  }
}

// Runs f on behalf of a raw abi callback. Nothing thrown
// inside may cross the abi, it becomes failure instead.
template <class R, class F> R
guard_boundary(char const* func, R failure, F&& f) noexcept
{
  try
  {
    return f();
  }
  catch (std::exception const& e)
  {
    log_boundary_exception(func, e.what());
    return failure;
  }
  catch (...)
  {
    log_boundary_exception(func, nullptr);
    return failure;
  }
}

template <class F> void
guard_boundary_void(char const* func, F&& f) noexcept
{
  static_assert(std::is_void_v<decltype(f())>);
  try
  {
    f();
  }
  catch (std::exception const& e)
  {
    log_boundary_exception(func, e.what());
  }
  catch (...)
  {
    log_boundary_exception(func, nullptr);
  }
}

}
