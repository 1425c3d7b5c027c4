#include <plugin_bridge/threading/handles.hpp>
#include <plugin_bridge/plugin/host_proxy.hpp>

namespace plugin_bridge {

host_handle::
host_handle(host_proxy* proxy):
_proxy(proxy)
{ assert(proxy); }

clap_host const*
host_handle::as_raw() const
{ return _proxy->as_raw(); }

void
host_handle::request_restart() const
{ _proxy->request_restart(); }

void
host_handle::request_process() const
{ _proxy->request_process(); }

void
host_handle::request_callback() const
{ _proxy->request_callback(); }

}
