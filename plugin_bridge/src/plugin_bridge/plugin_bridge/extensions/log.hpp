#pragma once

#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/shared/result.hpp>

#include <clap/ext/log.h>

#include <string>
#include <sstream>
#include <cstdint>
#include <optional>
#include <string_view>

namespace plugin_bridge {

enum class log_severity : std::int32_t {
  debug = CLAP_LOG_DEBUG,
  info = CLAP_LOG_INFO,
  warning = CLAP_LOG_WARNING,
  error = CLAP_LOG_ERROR,
  fatal = CLAP_LOG_FATAL,
  host_misbehaving = CLAP_LOG_HOST_MISBEHAVING,
  plugin_misbehaving = CLAP_LOG_PLUGIN_MISBEHAVING };

// empty for values this side does not know
std::optional<log_severity> log_severity_from_raw(std::int32_t raw);
char const* log_severity_name(log_severity severity);

enum class log_error { embedded_nul };
char const* log_error_text(log_error error);

// Plugin side facade over the host's log table. Any thread.
class host_log final:
public extension<clap_host_log>
{
public:
  static char const* id() { return CLAP_EXT_LOG; }
  explicit host_log(clap_host_log const* table) : extension(table) {}

  void log(host_handle const& host, log_severity severity, char const* message) const;
  status<log_error> log_str(host_handle const& host, log_severity severity, std::string_view message) const;

  // streams all arguments into one message
  template <class... Args> status<log_error>
  log_format(host_handle const& host, log_severity severity, Args const&... args) const
  {
    std::ostringstream stream;
    (stream << ... << args);
    return log_str(host, severity, stream.str());
  }
};

// Host side implementation of the log table.
class host_log_impl {
public:
  virtual ~host_log_impl() = default;
  virtual void log(log_severity severity, std::string_view message) = 0;

  static char const* extension_id() { return CLAP_EXT_LOG; }
  static clap_host_log const* extension_table();
};

}
