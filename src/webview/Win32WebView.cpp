#if defined(_WIN32)
#include "webview/Win32WebView.hpp"

#include "app/WindowRegistry.hpp"
#include "utils/Log.hpp"
#include "utils/Registry.hpp"
#include "utils/StringUtil.hpp"
#include "webview/RuntimeInstaller.hpp"

#include <objbase.h>

#include <cstdint>
#include <memory>

namespace wv::webview
{

namespace
{

constexpr wchar_t kWindowClassName[] = L"webview";
// Thread message that wakes the loop to drain the dispatch queue.
constexpr UINT kDispatchMessage = WM_APP;
// IDI_APPLICATION / IDC_ARROW.
constexpr WORD kDefaultIconId = 32512;
constexpr WORD kArrowCursorId = 32512;

app::WindowRegistry<Win32WebView> &window_registry()
{
    static app::WindowRegistry<Win32WebView> registry;
    return registry;
}

} // namespace

Win32WebView::Win32WebView(app::WebViewOptions const &options)
    : WebViewBase(options), thread_id_(GetCurrentThreadId()),
      browser_(app::resolve_data_path(options), options.debug,
               [this](std::string const &payload) { handle_message(payload); })
{
    set_waker([thread = thread_id_]
              { PostThreadMessageW(thread, kDispatchMessage, 0, 0); });
}

Win32WebView::~Win32WebView()
{
    browser_.close();
    if (hwnd_)
    {
        window_registry().remove(hwnd_);
        if (IsWindow(hwnd_))
        {
            DestroyWindow(hwnd_);
        }
        hwnd_ = nullptr;
    }
    if (icon_ && owns_icon_)
    {
        DestroyIcon(icon_);
    }
}

bool Win32WebView::create()
{
    auto const &window = options().window;
    HINSTANCE instance = GetModuleHandleW(nullptr);

    if (window.icon_id == 0)
    {
        icon_ = static_cast<HICON>(
            LoadImageW(instance, MAKEINTRESOURCEW(kDefaultIconId), IMAGE_ICON,
                       GetSystemMetrics(SM_CXICON),
                       GetSystemMetrics(SM_CYICON), 0));
        owns_icon_ = icon_ != nullptr;
    }
    else
    {
        icon_ = static_cast<HICON>(
            LoadImageW(instance, MAKEINTRESOURCEW(static_cast<WORD>(window.icon_id)), IMAGE_ICON,
                       0, 0, LR_DEFAULTSIZE | LR_SHARED));
    }
    if (!icon_)
    {
        icon_ = LoadIconW(nullptr, MAKEINTRESOURCEW(kDefaultIconId));
        owns_icon_ = false;
    }

    WNDCLASSEXW wc{};
    wc.cbSize = sizeof(wc);
    wc.lpfnWndProc = &Win32WebView::window_proc;
    wc.hInstance = instance;
    wc.hIcon = icon_;
    wc.hIconSm = icon_;
    wc.hCursor = LoadCursorW(nullptr, MAKEINTRESOURCEW(kArrowCursorId));
    wc.lpszClassName = kWindowClassName;
    if (!RegisterClassExW(&wc) && GetLastError() != ERROR_CLASS_ALREADY_EXISTS)
    {
        WV_LOG_ERROR("RegisterClassEx failed: {}",
                     utils::format_win_error_message(GetLastError()));
        return false;
    }

    auto placement = app::compute_placement(
        window, GetSystemMetrics(SM_CXSCREEN), GetSystemMetrics(SM_CYSCREEN));
    int x = placement.default_position ? CW_USEDEFAULT : placement.x;
    int y = placement.default_position ? CW_USEDEFAULT : placement.y;

    hwnd_ = CreateWindowExW(0, kWindowClassName,
                            utils::widen(window.title).c_str(),
                            WS_OVERLAPPEDWINDOW, x, y, placement.width,
                            placement.height, nullptr, nullptr, instance,
                            nullptr);
    if (!hwnd_)
    {
        WV_LOG_ERROR("CreateWindowEx failed: {}",
                     utils::format_win_error_message(GetLastError()));
        return false;
    }
    window_registry().add(hwnd_, this);

    ShowWindow(hwnd_, SW_SHOW);
    UpdateWindow(hwnd_);
    SetFocus(hwnd_);

    if (!browser_.embed(hwnd_))
    {
        return false;
    }
    browser_.resize();
    // Wakes that arrived while embedding were consumed by the embed loop.
    PostThreadMessageW(thread_id_, kDispatchMessage, 0, 0);
    return true;
}

void Win32WebView::run()
{
    MSG msg;
    while (true)
    {
        BOOL got = GetMessageW(&msg, nullptr, 0, 0);
        if (got == -1)
        {
            WV_LOG_ERROR("GetMessage failed: {}",
                         utils::format_win_error_message(GetLastError()));
            return;
        }
        if (got == 0)
        {
            return;
        }
        if (msg.message == kDispatchMessage && msg.hwnd == nullptr)
        {
            drain_dispatch_queue();
            continue;
        }
        HWND root = GetAncestor(msg.hwnd, GA_ROOT);
        if (root && IsDialogMessageW(root, &msg))
        {
            continue;
        }
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
}

void Win32WebView::terminate()
{
    PostQuitMessage(0);
}

void Win32WebView::destroy()
{
    terminate();
    if (hwnd_ && IsWindow(hwnd_))
    {
        DestroyWindow(hwnd_);
    }
}

void *Win32WebView::window() const
{
    return hwnd_;
}

void Win32WebView::navigate(std::string const &url)
{
    browser_.navigate(url);
}

void Win32WebView::set_title(std::string const &title)
{
    SetWindowTextW(hwnd_, utils::widen(title).c_str());
}

void Win32WebView::init(std::string const &js)
{
    browser_.init(js);
}

void Win32WebView::eval(std::string const &js)
{
    browser_.eval(js);
}

void Win32WebView::apply_frame_style(bool resizable)
{
    auto style = GetWindowLongPtrW(hwnd_, GWL_STYLE);
    if (resizable)
    {
        style |= WS_THICKFRAME | WS_MAXIMIZEBOX;
    }
    else
    {
        style &= ~static_cast<LONG_PTR>(WS_THICKFRAME | WS_MAXIMIZEBOX);
    }
    SetWindowLongPtrW(hwnd_, GWL_STYLE, style);
}

void Win32WebView::resize_client(int width, int height)
{
    RECT rect{0, 0, width, height};
    AdjustWindowRect(&rect, WS_OVERLAPPEDWINDOW, FALSE);
    SetWindowPos(hwnd_, nullptr, rect.left, rect.top, rect.right - rect.left,
                 rect.bottom - rect.top,
                 SWP_NOZORDER | SWP_NOACTIVATE | SWP_NOMOVE |
                     SWP_FRAMECHANGED);
    browser_.resize();
}

LRESULT CALLBACK Win32WebView::window_proc(HWND hwnd, UINT msg, WPARAM wparam,
                                           LPARAM lparam)
{
    if (auto *view = window_registry().find(hwnd))
    {
        return view->on_window_message(hwnd, msg, wparam, lparam);
    }
    return DefWindowProcW(hwnd, msg, wparam, lparam);
}

LRESULT Win32WebView::on_window_message(HWND hwnd, UINT msg, WPARAM wparam,
                                        LPARAM lparam)
{
    switch (msg)
    {
    case WM_MOVE:
    case WM_MOVING:
        browser_.notify_parent_window_position_changed();
        break;
    case WM_NCLBUTTONDOWN:
        SetFocus(hwnd);
        break;
    case WM_SIZE:
        browser_.resize();
        break;
    case WM_ACTIVATE:
        if (LOWORD(wparam) != WA_INACTIVE && options().auto_focus)
        {
            browser_.focus();
        }
        break;
    case WM_CLOSE:
        DestroyWindow(hwnd);
        break;
    case WM_DESTROY:
        window_registry().remove(hwnd);
        hwnd_ = nullptr;
        terminate();
        break;
    case WM_GETMINMAXINFO:
    {
        auto *info = reinterpret_cast<MINMAXINFO *>(lparam);
        auto const &limits = size_limits();
        if (limits.has_max())
        {
            info->ptMaxSize = {limits.max().x, limits.max().y};
            info->ptMaxTrackSize = info->ptMaxSize;
        }
        if (limits.has_min())
        {
            info->ptMinTrackSize = {limits.min().x, limits.min().y};
        }
        break;
    }
    default:
        break;
    }
    if (consumes_window_message(msg))
    {
        return 0;
    }
    return DefWindowProcW(hwnd, msg, wparam, lparam);
}

bool consumes_window_message(UINT msg) noexcept
{
    switch (msg)
    {
    case WM_MOVE:
    case WM_MOVING:
    case WM_SIZE:
    // DefWindowProc would take focus back from the browser.
    case WM_ACTIVATE:
    case WM_CLOSE:
    case WM_DESTROY:
    case WM_GETMINMAXINFO:
        return true;
    default:
        return false;
    }
}

void message_box(WebView const &view, std::string const &caption,
                 std::string const &text)
{
    MessageBoxW(static_cast<HWND>(view.window()), utils::widen(text).c_str(),
                utils::widen(caption).c_str(), MB_ICONWARNING);
}

std::unique_ptr<WebView> create_webview(app::WebViewOptions const &options)
{
    auto resolved = app::apply_environment(options);

    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    if (FAILED(hr) && hr != RPC_E_CHANGED_MODE)
    {
        WV_LOG_ERROR("CoInitializeEx failed ({:#X})",
                     static_cast<uint32_t>(hr));
        return nullptr;
    }

    auto install = ensure_runtime_installed();
    if (!install.success)
    {
        WV_LOG_ERROR("WebView2 runtime unavailable: {}", install.message);
        return nullptr;
    }
    if (install.installed)
    {
        WV_LOG_INFO("WebView2 runtime installed");
    }

    auto view = std::make_unique<Win32WebView>(resolved);
    if (!view->create())
    {
        return nullptr;
    }
    return view;
}

} // namespace wv::webview
#endif
