#include "app/DispatchQueue.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <utility>

namespace wv::app
{

DispatchQueue::DispatchQueue(Waker waker) : waker_(std::move(waker))
{
}

void DispatchQueue::set_waker(Waker waker)
{
    std::lock_guard<std::mutex> guard(mutex_);
    waker_ = std::move(waker);
}

void DispatchQueue::post(Task task)
{
    if (!task)
    {
        return;
    }
    Waker waker;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        tasks_.push_back(std::move(task));
        waker = waker_;
    }
    if (waker)
    {
        waker();
    }
}

std::size_t DispatchQueue::drain()
{
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        batch.swap(tasks_);
    }
    for (auto &task : batch)
    {
        try
        {
            task();
        }
        catch (std::exception const &ex)
        {
            WV_LOG_ERROR("dispatched task threw: {}", ex.what());
        }
    }
    return batch.size();
}

std::size_t DispatchQueue::pending() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return tasks_.size();
}

} // namespace wv::app
