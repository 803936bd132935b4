#pragma once

#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace wv::app
{

// Maps native window handles to the object that owns the window, so a
// window procedure can find its state. Starts empty; owners add an entry
// when the window is created and remove it when the window is destroyed.
template <typename Context> class WindowRegistry
{
  public:
    using Handle = void *;

    void add(Handle handle, Context *context)
    {
        if (handle == nullptr)
        {
            return;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_[handle] = context;
    }

    void remove(Handle handle)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.erase(handle);
    }

    Context *find(Handle handle) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(handle);
        return it == entries_.end() ? nullptr : it->second;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
    }

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Handle, Context *> entries_;
};

} // namespace wv::app
