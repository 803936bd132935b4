#pragma once

#include "app/DispatchQueue.hpp"
#include "app/Geometry.hpp"
#include "rpc/Dispatcher.hpp"
#include "webview/WebView.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace wv::webview
{

// Platform-independent half of a WebView: the RPC dispatcher, the dispatch
// queue and the size limits. Platform classes supply the window and the
// browser and wire the queue's waker to their message loop.
class WebViewBase : public WebView
{
  public:
    explicit WebViewBase(app::WebViewOptions const &options);

    void dispatch(std::function<void()> task) override;
    void bind_binding(std::string name, rpc::Binding binding) override;
    void set_size(int width, int height, app::Hint hint) override;

    // Entry point for messages posted by the page.
    void handle_message(std::string_view payload);

    // Runs every task queued so far; called once per wake.
    std::size_t drain_dispatch_queue();

    rpc::Dispatcher &dispatcher() noexcept;
    app::SizeLimits const &size_limits() const noexcept;
    app::WebViewOptions const &options() const noexcept;

  protected:
    void set_waker(app::DispatchQueue::Waker waker);

    virtual void apply_frame_style(bool resizable) = 0;
    // Resizes the window so its client area is width x height.
    virtual void resize_client(int width, int height) = 0;

  private:
    app::WebViewOptions options_;
    app::DispatchQueue queue_;
    rpc::Dispatcher dispatcher_;
    app::SizeLimits limits_;
};

} // namespace wv::webview
