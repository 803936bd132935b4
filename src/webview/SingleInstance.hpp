#pragma once

#include <string>

namespace wv::webview
{

// Holds a named mutex for the lifetime of the object. acquired() is false
// when another process already holds a lock with the same name.
class SingleInstanceLock
{
  public:
    explicit SingleInstanceLock(std::string const &name);
    ~SingleInstanceLock();

    SingleInstanceLock(SingleInstanceLock const &) = delete;
    SingleInstanceLock &operator=(SingleInstanceLock const &) = delete;

    bool acquired() const noexcept { return acquired_; }

  private:
    void *handle_ = nullptr;
    bool acquired_ = false;
};

} // namespace wv::webview
