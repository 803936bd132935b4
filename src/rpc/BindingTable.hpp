#pragma once

#include "rpc/Binding.hpp"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wv::rpc
{

// Named callables reachable from script. Lookups happen on every call and
// take a shared lock; binding a name takes an exclusive one.
class BindingTable
{
  public:
    // Registers `binding` under `name`, replacing any earlier entry.
    // Returns true when an entry was replaced.
    bool bind(std::string name, Binding binding);

    // The entry for `name`, or nullptr. The snapshot stays valid even if
    // the name is re-bound while the caller still holds it.
    std::shared_ptr<Binding const> find(std::string const &name) const;

    bool contains(std::string const &name) const;
    std::vector<std::string> names() const;
    std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Binding const>> bindings_;
};

} // namespace wv::rpc
