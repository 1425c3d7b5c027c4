#include <plugin_bridge/plugin/host_proxy.hpp>

namespace plugin_bridge {

host_proxy::
host_proxy(clap_host const* host):
_host(host)
{ assert(host); }

}
