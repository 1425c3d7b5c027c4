#include <plugin_bridge/extensions/params.hpp>
#include <plugin_bridge/host/host_wrapper.hpp>

#include <vector>

namespace plugin_bridge {

std::uint32_t
plugin_params::count(plugin_main_thread_handle const& plugin) const
{
  if (_table->count == nullptr) return 0;
  return _table->count(plugin.as_raw());
}

std::optional<param_info>
plugin_params::get_info(plugin_main_thread_handle const& plugin, std::uint32_t index) const
{
  if (_table->get_info == nullptr) return std::nullopt;
  clap_param_info raw = {};
  if (!_table->get_info(plugin.as_raw(), index, &raw)) return std::nullopt;

  // peers are not trusted to terminate fixed size strings
  raw.name[CLAP_NAME_SIZE - 1] = '\0';
  raw.module[CLAP_PATH_SIZE - 1] = '\0';
  return param_info {
    raw.id, raw.flags, raw.cookie, raw.name, raw.module,
    raw.min_value, raw.max_value, raw.default_value };
}

std::optional<double>
plugin_params::get_value(plugin_main_thread_handle const& plugin, clap_id param_id) const
{
  if (_table->get_value == nullptr) return std::nullopt;
  double value = 0.0;
  if (!_table->get_value(plugin.as_raw(), param_id, &value)) return std::nullopt;
  return value;
}

std::optional<std::string>
plugin_params::value_to_text(plugin_main_thread_handle const& plugin, clap_id param_id, double value) const
{
  if (_table->value_to_text == nullptr) return std::nullopt;
  std::vector<char> buffer(text_capacity, '\0');
  if (!_table->value_to_text(plugin.as_raw(), param_id, value, buffer.data(), text_capacity)) return std::nullopt;
  buffer[text_capacity - 1] = '\0';
  return std::string(buffer.data());
}

std::optional<double>
plugin_params::text_to_value(plugin_main_thread_handle const& plugin, clap_id param_id, std::string const& text) const
{
  if (_table->text_to_value == nullptr) return std::nullopt;
  double value = 0.0;
  if (!_table->text_to_value(plugin.as_raw(), param_id, text.c_str(), &value)) return std::nullopt;
  return value;
}

void
plugin_params::flush(plugin_handle const& plugin, input_event_list const& in, output_event_list const& out) const
{
  if (_table->flush != nullptr)
    _table->flush(plugin.as_raw(), in.as_raw(), out.as_raw());
}

void
host_params::rescan(host_main_thread_handle const& host, clap_param_rescan_flags flags) const
{
  if (_table->rescan != nullptr)
    _table->rescan(host.as_raw(), flags);
}

void
host_params::clear(host_main_thread_handle const& host, clap_id param_id, clap_param_clear_flags flags) const
{
  if (_table->clear != nullptr)
    _table->clear(host.as_raw(), param_id, flags);
}

void
host_params::request_flush(host_handle const& host) const
{
  if (_table->request_flush != nullptr)
    _table->request_flush(host.as_raw());
}

void
to_raw(param_info const& info, clap_param_info& raw)
{
  raw = {};
  raw.id = info.id;
  raw.flags = info.flags;
  raw.cookie = info.cookie;
  from_8bit_string(raw.name, info.name.c_str());
  from_8bit_string(raw.module, info.module.c_str());
  raw.min_value = info.min_value;
  raw.max_value = info.max_value;
  raw.default_value = info.default_value;
}

static void CLAP_ABI
clap_host_params_rescan(clap_host const* host, clap_param_rescan_flags flags)
{
  host_wrapper::dispatch_main_void<host_params_impl>(host, __func__,
    [=](host_params_impl& impl) { impl.rescan(flags); });
}

static void CLAP_ABI
clap_host_params_clear(clap_host const* host, clap_id param_id, clap_param_clear_flags flags)
{
  host_wrapper::dispatch_main_void<host_params_impl>(host, __func__,
    [=](host_params_impl& impl) { impl.clear(param_id, flags); });
}

static void CLAP_ABI
clap_host_params_request_flush(clap_host const* host)
{
  host_wrapper::dispatch_void<host_params_impl>(host, __func__,
    [](host_params_impl& impl) { impl.request_flush(); });
}

clap_host_params const*
host_params_impl::extension_table()
{
  static clap_host_params const table = {
    .rescan = clap_host_params_rescan,
    .clear = clap_host_params_clear,
    .request_flush = clap_host_params_request_flush };
  return &table;
}

}
