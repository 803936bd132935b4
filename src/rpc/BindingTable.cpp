#include "rpc/BindingTable.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace wv::rpc
{

bool BindingTable::bind(std::string name, Binding binding)
{
    auto entry = std::make_shared<Binding const>(std::move(binding));
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result =
        bindings_.insert_or_assign(std::move(name), std::move(entry));
    return !result.second;
}

std::shared_ptr<Binding const> BindingTable::find(std::string const &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = bindings_.find(name);
    if (it == bindings_.end())
    {
        return nullptr;
    }
    return it->second;
}

bool BindingTable::contains(std::string const &name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bindings_.count(name) != 0;
}

std::vector<std::string> BindingTable::names() const
{
    std::vector<std::string> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(bindings_.size());
        for (auto const &[name, binding] : bindings_)
        {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t BindingTable::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bindings_.size();
}

} // namespace wv::rpc
