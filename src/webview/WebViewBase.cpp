#include "webview/WebViewBase.hpp"

#include <utility>

namespace wv::webview
{

WebViewBase::WebViewBase(app::WebViewOptions const &options)
    : options_(options),
      dispatcher_([this](std::string js) { eval(js); },
                  [this](std::string js) { init(js); },
                  [this](std::function<void()> task)
                  { queue_.post(std::move(task)); },
                  options.unknown_methods)
{
}

void WebViewBase::dispatch(std::function<void()> task)
{
    queue_.post(std::move(task));
}

void WebViewBase::bind_binding(std::string name, rpc::Binding binding)
{
    dispatcher_.bind_binding(std::move(name), std::move(binding));
}

void WebViewBase::set_size(int width, int height, app::Hint hint)
{
    apply_frame_style(app::is_resizable(hint));
    if (limits_.apply(width, height, hint))
    {
        resize_client(width, height);
    }
}

void WebViewBase::handle_message(std::string_view payload)
{
    dispatcher_.dispatch(payload);
}

std::size_t WebViewBase::drain_dispatch_queue()
{
    return queue_.drain();
}

rpc::Dispatcher &WebViewBase::dispatcher() noexcept
{
    return dispatcher_;
}

app::SizeLimits const &WebViewBase::size_limits() const noexcept
{
    return limits_;
}

app::WebViewOptions const &WebViewBase::options() const noexcept
{
    return options_;
}

void WebViewBase::set_waker(app::DispatchQueue::Waker waker)
{
    queue_.set_waker(std::move(waker));
}

} // namespace wv::webview
