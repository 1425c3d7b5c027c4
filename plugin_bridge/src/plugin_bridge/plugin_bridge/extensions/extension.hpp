#pragma once

#include <plugin_bridge/shared/utility.hpp>

#include <map>
#include <string>
#include <vector>
#include <cassert>
#include <utility>
#include <optional>
#include <typeinfo>

namespace plugin_bridge {

// Typed facade over a table the peer handed out.
// Never null, the peer owns it for the lifetime of the instance.
template <class Raw>
class extension {
protected:
  Raw const* _table;

public:
  typedef Raw raw_type;
  explicit extension(Raw const* table) : _table(table) { assert(table); }
  Raw const* as_raw() const { return _table; }
};

enum class negotiation_state { unqueried, unsupported, supported };

// Outcome of the single query per extension id.
// Null answers stick, the peer is not asked again.
class extension_cache final {
  struct entry
  {
    negotiation_state state;
    void const* table;
  };
  std::map<std::string, entry> _entries = {};

public:
  PBRIDGE_PREVENT_ACCIDENTAL_COPY(extension_cache);
  extension_cache() = default;

  void clear() { _entries.clear(); }
  negotiation_state state(char const* id) const;

  // query is void const*(char const* id)
  template <class Query> void const*
  get(char const* id, Query&& query)
  {
    auto iter = _entries.find(id);
    if (iter != _entries.end()) return iter->second.table;
    void const* table = query(id);
    auto state = table == nullptr ? negotiation_state::unsupported : negotiation_state::supported;
    _entries[id] = { state, table };
    return table;
  }

  // Ext is a facade with static id() and raw_type
  template <class Ext, class Query> std::optional<Ext>
  negotiate(Query&& query)
  {
    void const* table = get(Ext::id(), std::forward<Query>(query));
    if (table == nullptr) return std::nullopt;
    return Ext(static_cast<typename Ext::raw_type const*>(table));
  }
};

// What the answering side hands out when asked for an extension.
// Implementation interfaces provide static extension_id() and extension_table().
// A null table means the wrapper answers with its own table for that id.
class extension_declarations final {
  struct entry
  {
    char const* id;
    void const* table;
    void* impl;
    std::type_info const* type;
  };
  std::vector<entry> _entries = {};

public:
  PBRIDGE_PIN_ADDRESS(extension_declarations);
  extension_declarations() = default;

  // Impl is the interface, not the implementing class
  template <class Impl> void
  add(Impl& impl)
  { add_entry(Impl::extension_id(), Impl::extension_table(), static_cast<void*>(&impl), &typeid(Impl)); }

  // table without an implementation object, answered as is
  void add_raw(char const* id, void const* table);

  void clear() { _entries.clear(); }
  std::size_t size() const { return _entries.size(); }
  bool contains(char const* id) const;
  void const* find_table(char const* id) const;

  template <class Impl> Impl*
  find_impl() const
  {
    for (auto const& e : _entries)
      if (e.impl != nullptr && *e.type == typeid(Impl))
        return static_cast<Impl*>(e.impl);
    return nullptr;
  }

private:
  void add_entry(char const* id, void const* table, void* impl, std::type_info const* type);
};

}
