#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/threading/handles.hpp>

#include <clap/ext/thread-check.h>
#include <optional>

namespace plugin_bridge {

// Plugin side facade over the host's thread check table.
// Empty answers mean the host left the entry out.
class host_thread_check final:
public extension<clap_host_thread_check>
{
public:
  static char const* id() { return CLAP_EXT_THREAD_CHECK; }
  explicit host_thread_check(clap_host_thread_check const* table) : extension(table) {}

  std::optional<bool> is_main_thread(host_handle const& host) const;
  std::optional<bool> is_audio_thread(host_handle const& host) const;
};

class host_thread_check_impl {
public:
  virtual ~host_thread_check_impl() = default;
  virtual bool is_main_thread() = 0;
  virtual bool is_audio_thread() = 0;

  static char const* extension_id() { return CLAP_EXT_THREAD_CHECK; }
  static clap_host_thread_check const* extension_table();
};

}
