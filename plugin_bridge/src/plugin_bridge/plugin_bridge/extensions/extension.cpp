#include <plugin_bridge/extensions/extension.hpp>
#include <plugin_bridge/shared/logger.hpp>

#include <cstring>

namespace plugin_bridge {

negotiation_state
extension_cache::state(char const* id) const
{
  auto iter = _entries.find(id);
  if (iter == _entries.end()) return negotiation_state::unqueried;
  return iter->second.state;
}

bool
extension_declarations::contains(char const* id) const
{
  if (id == nullptr) return false;
  for (auto const& e : _entries)
    if (!strcmp(e.id, id))
      return true;
  return false;
}

void const*
extension_declarations::find_table(char const* id) const
{
  if (id == nullptr) return nullptr;
  for (auto const& e : _entries)
    if (!strcmp(e.id, id))
      return e.table;
  return nullptr;
}

void
extension_declarations::add_raw(char const* id, void const* table)
{
  assert(table != nullptr);
  add_entry(id, table, nullptr, nullptr);
}

// first declaration wins
void
extension_declarations::add_entry(char const* id, void const* table, void* impl, std::type_info const* type)
{
  assert(id != nullptr && (table != nullptr || impl != nullptr));
  if (contains(id))
  {
    PBRIDGE_WRITE_LOG_AT(warning, std::string("Extension declared twice: ") + id + ".");
    return;
  }
  _entries.push_back({ id, table, impl, type });
}

}
