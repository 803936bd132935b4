#pragma once

#include <filesystem>
#include <functional>
#include <string>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <webview2.h>
#include <wrl/client.h>

namespace wv::webview
{

// One WebView2 controller filling the client area of a parent window.
class EdgeBrowser
{
  public:
    using MessageHandler = std::function<void(std::string const &)>;

    EdgeBrowser(std::filesystem::path data_path, bool debug,
                MessageHandler on_message);
    ~EdgeBrowser();

    EdgeBrowser(EdgeBrowser const &) = delete;
    EdgeBrowser &operator=(EdgeBrowser const &) = delete;

    // Creates the environment and controller for `parent`, pumping the
    // thread's messages until both exist. Returns false on failure.
    bool embed(HWND parent);
    void close();

    void resize();
    void focus();
    void notify_parent_window_position_changed();

    void navigate(std::string const &url);
    void init(std::string const &js);
    void eval(std::string const &js);

  private:
    HRESULT on_controller_created(ICoreWebView2Controller *controller);
    void apply_settings();

    std::filesystem::path data_path_;
    bool debug_ = false;
    MessageHandler on_message_;
    HWND parent_ = nullptr;
    Microsoft::WRL::ComPtr<ICoreWebView2Controller> controller_;
    Microsoft::WRL::ComPtr<ICoreWebView2> webview_;
    EventRegistrationToken message_token_{};
    EventRegistrationToken permission_token_{};
};

} // namespace wv::webview
