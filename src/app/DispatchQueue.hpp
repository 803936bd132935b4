#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace wv::app
{

// Channel of closures from any thread to the single thread that owns a
// window. post() appends and then fires the waker; the owner calls drain()
// once per wake.
class DispatchQueue
{
  public:
    using Task = std::function<void()>;
    using Waker = std::function<void()>;

    explicit DispatchQueue(Waker waker = {});
    DispatchQueue(DispatchQueue const &) = delete;
    DispatchQueue &operator=(DispatchQueue const &) = delete;

    void set_waker(Waker waker);

    void post(Task task);

    // Swaps out everything queued so far and runs it in order. Tasks posted
    // while draining wait for the next drain. Returns the number run.
    std::size_t drain();

    std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
    Waker waker_;
};

} // namespace wv::app
