#pragma once

#include "webview/EdgeBrowser.hpp"
#include "webview/WebViewBase.hpp"

#include <string>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

namespace wv::webview
{

class Win32WebView final : public WebViewBase
{
  public:
    explicit Win32WebView(app::WebViewOptions const &options);
    ~Win32WebView() override;

    // Creates the top-level window and embeds the browser in it.
    bool create();

    void run() override;
    void terminate() override;
    void destroy() override;
    void *window() const override;
    void navigate(std::string const &url) override;
    void set_title(std::string const &title) override;
    void init(std::string const &js) override;
    void eval(std::string const &js) override;

  protected:
    void apply_frame_style(bool resizable) override;
    void resize_client(int width, int height) override;

  private:
    static LRESULT CALLBACK window_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                        LPARAM lparam);
    LRESULT on_window_message(HWND hwnd, UINT msg, WPARAM wparam, LPARAM lparam);

    HWND hwnd_ = nullptr;
    DWORD thread_id_ = 0;
    HICON icon_ = nullptr;
    bool owns_icon_ = false;
    EdgeBrowser browser_;
};

// True for window messages answered with 0 instead of being passed on to
// DefWindowProc.
bool consumes_window_message(UINT msg) noexcept;

// Modal warning box owned by the view's window.
void message_box(WebView const &view, std::string const &caption,
                 std::string const &text);

} // namespace wv::webview
