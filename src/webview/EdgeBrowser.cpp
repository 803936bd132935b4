#if defined(_WIN32)
#include "webview/EdgeBrowser.hpp"

#include "utils/Log.hpp"
#include "utils/StringUtil.hpp"
#include "webview/Loader.hpp"

#include <wrl/event.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <system_error>
#include <utility>

namespace wv::webview
{

namespace
{

struct EmbedState
{
    bool done = false;
    bool abandoned = false;
    HRESULT result = S_OK;
};

constexpr char kExternalInvokeScript[] =
    "window.external = {invoke: s => window.chrome.webview.postMessage(s)};";

} // namespace

EdgeBrowser::EdgeBrowser(std::filesystem::path data_path, bool debug,
                         MessageHandler on_message)
    : data_path_(std::move(data_path)), debug_(debug),
      on_message_(std::move(on_message))
{
}

EdgeBrowser::~EdgeBrowser()
{
    close();
}

bool EdgeBrowser::embed(HWND parent)
{
    parent_ = parent;
    std::error_code ec;
    std::filesystem::create_directories(data_path_, ec);
    if (ec)
    {
        WV_LOG_WARN("failed to create {}: {}", data_path_.string(),
                    ec.message());
    }

    // Shared with the completion handlers, which may outlive this call when
    // the embed is abandoned.
    auto state = std::make_shared<EmbedState>();
    auto data_folder = data_path_.wstring();
    HRESULT hr = loader::create_environment(
        nullptr, data_folder.c_str(), nullptr,
        Microsoft::WRL::Callback<
            ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler>(
            [this, state](HRESULT env_res,
                          ICoreWebView2Environment *env) -> HRESULT
            {
                if (state->abandoned)
                {
                    return S_OK;
                }
                if (FAILED(env_res) || !env)
                {
                    state->result = FAILED(env_res) ? env_res : E_FAIL;
                    state->done = true;
                    return S_OK;
                }
                HRESULT create_hr = env->CreateCoreWebView2Controller(
                    parent_,
                    Microsoft::WRL::Callback<
                        ICoreWebView2CreateCoreWebView2ControllerCompletedHandler>(
                        [this, state](HRESULT ctrl_res,
                                      ICoreWebView2Controller *controller)
                            -> HRESULT
                        {
                            if (state->abandoned)
                            {
                                if (controller)
                                {
                                    controller->Close();
                                }
                                return S_OK;
                            }
                            if (FAILED(ctrl_res) || !controller)
                            {
                                state->result =
                                    FAILED(ctrl_res) ? ctrl_res : E_FAIL;
                            }
                            else
                            {
                                state->result =
                                    on_controller_created(controller);
                            }
                            state->done = true;
                            return S_OK;
                        })
                        .Get());
                if (FAILED(create_hr))
                {
                    state->result = create_hr;
                    state->done = true;
                }
                return S_OK;
            })
            .Get());
    if (FAILED(hr))
    {
        WV_LOG_ERROR("WebView2 environment creation failed ({:#X})",
                     static_cast<uint32_t>(hr));
        return false;
    }

    MSG msg;
    while (!state->done)
    {
        BOOL got = GetMessageW(&msg, nullptr, 0, 0);
        if (got == -1)
        {
            WV_LOG_ERROR("GetMessage failed while embedding WebView2");
            state->abandoned = true;
            return false;
        }
        if (got == 0)
        {
            // Leave the quit for the caller's loop.
            state->abandoned = true;
            PostQuitMessage(static_cast<int>(msg.wParam));
            return false;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }

    HRESULT result = state->result;
    if (FAILED(result))
    {
        WV_LOG_ERROR("WebView2 initialization failed ({:#X})",
                     static_cast<uint32_t>(result));
        close();
        return false;
    }
    init(kExternalInvokeScript);
    return true;
}

HRESULT EdgeBrowser::on_controller_created(ICoreWebView2Controller *controller)
{
    controller_ = controller;
    HRESULT hr = controller_->get_CoreWebView2(&webview_);
    if (FAILED(hr) || !webview_)
    {
        return FAILED(hr) ? hr : E_NOINTERFACE;
    }

    apply_settings();

    webview_->add_WebMessageReceived(
        Microsoft::WRL::Callback<ICoreWebView2WebMessageReceivedEventHandler>(
            [this](ICoreWebView2 *,
                   ICoreWebView2WebMessageReceivedEventArgs *args) -> HRESULT
            {
                LPWSTR text = nullptr;
                if (SUCCEEDED(args->TryGetWebMessageAsString(&text)) && text)
                {
                    std::wstring wide(text);
                    CoTaskMemFree(text);
                    if (on_message_)
                    {
                        on_message_(utils::narrow(wide));
                    }
                }
                return S_OK;
            })
            .Get(),
        &message_token_);

    webview_->add_PermissionRequested(
        Microsoft::WRL::Callback<ICoreWebView2PermissionRequestedEventHandler>(
            [](ICoreWebView2 *,
               ICoreWebView2PermissionRequestedEventArgs *args) -> HRESULT
            {
                COREWEBVIEW2_PERMISSION_KIND kind{};
                if (SUCCEEDED(args->get_PermissionKind(&kind)) &&
                    kind == COREWEBVIEW2_PERMISSION_KIND_CLIPBOARD_READ)
                {
                    args->put_State(COREWEBVIEW2_PERMISSION_STATE_ALLOW);
                }
                return S_OK;
            })
            .Get(),
        &permission_token_);

    controller_->put_IsVisible(TRUE);
    resize();
    return S_OK;
}

void EdgeBrowser::apply_settings()
{
    Microsoft::WRL::ComPtr<ICoreWebView2Settings> settings;
    HRESULT hr = webview_->get_Settings(&settings);
    if (FAILED(hr) || !settings)
    {
        WV_LOG_ERROR("WebView2 get_Settings failed ({:#X})",
                     static_cast<uint32_t>(hr));
        std::exit(EXIT_FAILURE);
    }
    BOOL enabled = debug_ ? TRUE : FALSE;
    hr = settings->put_AreDefaultContextMenusEnabled(enabled);
    if (FAILED(hr))
    {
        WV_LOG_ERROR("WebView2 put_AreDefaultContextMenusEnabled failed "
                     "({:#X})",
                     static_cast<uint32_t>(hr));
        std::exit(EXIT_FAILURE);
    }
    hr = settings->put_AreDevToolsEnabled(enabled);
    if (FAILED(hr))
    {
        WV_LOG_ERROR("WebView2 put_AreDevToolsEnabled failed ({:#X})",
                     static_cast<uint32_t>(hr));
        std::exit(EXIT_FAILURE);
    }
}

void EdgeBrowser::close()
{
    if (webview_)
    {
        webview_->remove_WebMessageReceived(message_token_);
        webview_->remove_PermissionRequested(permission_token_);
        webview_.Reset();
    }
    if (controller_)
    {
        controller_->Close();
        controller_.Reset();
    }
}

void EdgeBrowser::resize()
{
    if (!controller_ || !parent_)
    {
        return;
    }
    RECT bounds{};
    if (GetClientRect(parent_, &bounds))
    {
        controller_->put_Bounds(bounds);
    }
}

void EdgeBrowser::focus()
{
    if (controller_)
    {
        controller_->MoveFocus(COREWEBVIEW2_MOVE_FOCUS_REASON_PROGRAMMATIC);
    }
}

void EdgeBrowser::notify_parent_window_position_changed()
{
    if (controller_)
    {
        controller_->NotifyParentWindowPositionChanged();
    }
}

void EdgeBrowser::navigate(std::string const &url)
{
    if (!webview_)
    {
        return;
    }
    HRESULT hr = webview_->Navigate(utils::widen(url).c_str());
    if (FAILED(hr))
    {
        WV_LOG_WARN("Navigate({}) failed ({:#X})", url,
                    static_cast<uint32_t>(hr));
    }
}

void EdgeBrowser::init(std::string const &js)
{
    if (!webview_)
    {
        return;
    }
    HRESULT hr = webview_->AddScriptToExecuteOnDocumentCreated(
        utils::widen(js).c_str(), nullptr);
    if (FAILED(hr))
    {
        WV_LOG_WARN("AddScriptToExecuteOnDocumentCreated failed ({:#X})",
                    static_cast<uint32_t>(hr));
    }
}

void EdgeBrowser::eval(std::string const &js)
{
    if (!webview_)
    {
        return;
    }
    HRESULT hr = webview_->ExecuteScript(utils::widen(js).c_str(), nullptr);
    if (FAILED(hr))
    {
        WV_LOG_WARN("ExecuteScript failed ({:#X})", static_cast<uint32_t>(hr));
    }
}

} // namespace wv::webview
#endif
