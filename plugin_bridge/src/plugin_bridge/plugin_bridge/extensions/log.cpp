#include <plugin_bridge/extensions/log.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>

#include <string>

namespace plugin_bridge {

std::optional<log_severity>
log_severity_from_raw(std::int32_t raw)
{
  switch (raw)
  {
  case CLAP_LOG_DEBUG: return log_severity::debug;
  case CLAP_LOG_INFO: return log_severity::info;
  case CLAP_LOG_WARNING: return log_severity::warning;
  case CLAP_LOG_ERROR: return log_severity::error;
  case CLAP_LOG_FATAL: return log_severity::fatal;
  case CLAP_LOG_HOST_MISBEHAVING: return log_severity::host_misbehaving;
  case CLAP_LOG_PLUGIN_MISBEHAVING: return log_severity::plugin_misbehaving;
  default: return std::nullopt;
  }
}

char const*
log_severity_name(log_severity severity)
{
  switch (severity)
  {
  case log_severity::debug: return "debug";
  case log_severity::info: return "info";
  case log_severity::warning: return "warning";
  case log_severity::error: return "error";
  case log_severity::fatal: return "fatal";
  case log_severity::host_misbehaving: return "host misbehaving";
  case log_severity::plugin_misbehaving: return "plugin misbehaving";
  default: return "unknown";
  }
}

char const*
log_error_text(log_error error)
{
  switch (error)
  {
  case log_error::embedded_nul: return "Log message contains an embedded NUL byte.";
  default: return "Unknown log error.";
  }
}

void
host_log::log(host_handle const& host, log_severity severity, char const* message) const
{
  if (_table->log == nullptr) return;
  _table->log(host.as_raw(), static_cast<clap_log_severity>(severity), message == nullptr ? "" : message);
}

status<log_error>
host_log::log_str(host_handle const& host, log_severity severity, std::string_view message) const
{
  if (has_embedded_nul(message)) return log_error::embedded_nul;
  std::string terminated(message);
  log(host, severity, terminated.c_str());
  return {};
}

static void CLAP_ABI
clap_log(clap_host const* host, clap_log_severity severity, char const* msg)
{
  auto func = __func__;
  host_wrapper::dispatch_void<host_log_impl>(host, func, [&](host_log_impl& impl) {
    auto decoded = log_severity_from_raw(severity);
    if (!decoded)
    {
      report_misbehaviour(host_wrapper::from_raw(host, func)->config(), func,
        "Plugin logged with unknown severity " + std::to_string(severity) + ".");
      return;
    }
    impl.log(*decoded, msg == nullptr ? std::string_view() : std::string_view(msg));
  });
}

clap_host_log const*
host_log_impl::extension_table()
{
  static clap_host_log const table = { .log = clap_log };
  return &table;
}

}
