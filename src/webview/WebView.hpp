#pragma once

#include "app/Options.hpp"
#include "rpc/Binding.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace wv::webview
{

// A native window hosting one browser instance.
//
// All methods except dispatch() must be called on the thread that created
// the window. dispatch() may be called from any thread.
class WebView
{
  public:
    virtual ~WebView() = default;

    // Runs the message loop until terminate() is called.
    virtual void run() = 0;
    // Stops the message loop. Safe to call from a dispatched task.
    virtual void terminate() = 0;
    // Schedules `task` to run on the window's thread.
    virtual void dispatch(std::function<void()> task) = 0;
    virtual void destroy() = 0;

    // Native window handle (HWND on Windows).
    virtual void *window() const = 0;

    virtual void navigate(std::string const &url) = 0;
    virtual void set_title(std::string const &title) = 0;
    virtual void set_size(int width, int height, app::Hint hint) = 0;

    // Injects `js` into every document before its own scripts run.
    virtual void init(std::string const &js) = 0;
    // Evaluates `js` in the current document.
    virtual void eval(std::string const &js) = 0;

    // Exposes `fn` to script as a global promise-returning function.
    // Re-binding a name replaces the earlier callable.
    template <typename F> void bind(std::string name, F fn)
    {
        bind_binding(std::move(name), rpc::make_binding(std::move(fn)));
    }

    virtual void bind_binding(std::string name, rpc::Binding binding) = 0;
};

// Creates a window and embeds the browser. Returns nullptr when the
// runtime is missing and could not be installed, or when the window or the
// browser can not be created.
std::unique_ptr<WebView> create_webview(app::WebViewOptions const &options);

} // namespace wv::webview
