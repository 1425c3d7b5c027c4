#include <plugin_bridge/extensions/thread_check.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>

namespace plugin_bridge {

std::optional<bool>
host_thread_check::is_main_thread(host_handle const& host) const
{
  if (_table->is_main_thread == nullptr) return std::nullopt;
  return _table->is_main_thread(host.as_raw());
}

std::optional<bool>
host_thread_check::is_audio_thread(host_handle const& host) const
{
  if (_table->is_audio_thread == nullptr) return std::nullopt;
  return _table->is_audio_thread(host.as_raw());
}

static bool CLAP_ABI
clap_is_main_thread(clap_host const* host)
{
  return host_wrapper::dispatch<host_thread_check_impl>(host, __func__, false,
    [](host_thread_check_impl& impl) { return impl.is_main_thread(); });
}

static bool CLAP_ABI
clap_is_audio_thread(clap_host const* host)
{
  return host_wrapper::dispatch<host_thread_check_impl>(host, __func__, false,
    [](host_thread_check_impl& impl) { return impl.is_audio_thread(); });
}

clap_host_thread_check const*
host_thread_check_impl::extension_table()
{
  static clap_host_thread_check const table = {
    .is_main_thread = clap_is_main_thread,
    .is_audio_thread = clap_is_audio_thread };
  return &table;
}

}
