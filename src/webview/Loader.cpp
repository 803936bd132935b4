#if defined(_WIN32)
#include "webview/Loader.hpp"

#include "utils/Log.hpp"
#include "utils/Registry.hpp"
#include "utils/StringUtil.hpp"
#include "webview/RuntimeInstaller.hpp"
#include "webview/RuntimeVersion.hpp"

#include <array>
#include <cstdint>
#include <cwchar>
#include <mutex>
#include <optional>
#include <string>

namespace wv::webview::loader
{

namespace
{

using CreateEnvironmentFn = HRESULT(STDAPICALLTYPE *)(
    PCWSTR, PCWSTR, ICoreWebView2EnvironmentOptions *,
    ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler *);
using BrowserVersionFn = HRESULT(STDAPICALLTYPE *)(PCWSTR, LPWSTR *);
using CompareVersionsFn = HRESULT(STDAPICALLTYPE *)(PCWSTR, PCWSTR, int *);
// Exported by EmbeddedBrowserWebView.dll. The first two arguments select an
// installed (not embedded) runtime.
using CreateInternalFn = HRESULT(STDMETHODCALLTYPE *)(
    bool, int, PCWSTR, IUnknown *,
    ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler *);

constexpr wchar_t kLoaderDll[] = L"WebView2Loader.dll";
constexpr wchar_t kClientStateKey[] =
    L"SOFTWARE\\Microsoft\\EdgeUpdate\\ClientState\\";

// Stable first, then beta, dev and canary.
constexpr std::array<wchar_t const *, 4> kChannelGuids = {
    L"{F3017226-FE2A-4295-8BDF-00C3A9A7E4C5}",
    L"{2CD8A007-E189-409D-A2C8-9AF4EF3C72AA}",
    L"{0D50BFEC-CD6A-4F9A-964C-C7416E3ACB10}",
    L"{65C35B14-6C1D-4122-AC46-7148CC9D6497}",
};

struct LoaderExports
{
    HMODULE module = nullptr;
    CreateEnvironmentFn create = nullptr;
    BrowserVersionFn version = nullptr;
    CompareVersionsFn compare = nullptr;
};

template <typename Fn> Fn find_export(HMODULE module, char const *name)
{
    return reinterpret_cast<Fn>(
        reinterpret_cast<void *>(GetProcAddress(module, name)));
}

LoaderExports const &system_loader()
{
    static std::once_flag once;
    static LoaderExports exports;
    std::call_once(
        once,
        []
        {
            exports.module = LoadLibraryW(kLoaderDll);
            if (!exports.module)
            {
                WV_LOG_INFO("WebView2Loader.dll not found ({}); using the "
                            "installed runtime directly",
                            utils::format_win_error_message(GetLastError()));
                return;
            }
            exports.create = find_export<CreateEnvironmentFn>(
                exports.module, "CreateCoreWebView2EnvironmentWithOptions");
            exports.version = find_export<BrowserVersionFn>(
                exports.module, "GetAvailableCoreWebView2BrowserVersionString");
            exports.compare = find_export<CompareVersionsFn>(
                exports.module, "CompareBrowserVersions");
            if (!exports.create || !exports.version || !exports.compare)
            {
                WV_LOG_WARN("WebView2Loader.dll is missing exports; using the "
                            "installed runtime directly");
            }
        });
    return exports;
}

std::optional<std::wstring> embedded_browser_dll()
{
    for (auto const *guid : kChannelGuids)
    {
        std::wstring key = std::wstring(kClientStateKey) + guid;
        for (HKEY root : {HKEY_LOCAL_MACHINE, HKEY_CURRENT_USER})
        {
            auto folder = utils::read_registry_string(root, key.c_str(),
                                                      L"EBWebView",
                                                      KEY_WOW64_32KEY);
            if (!folder || folder->empty())
            {
                continue;
            }
            std::wstring path = *folder;
            if (path.back() != L'\\' && path.back() != L'/')
            {
                path += L'\\';
            }
#if defined(_M_ARM64)
            path += L"EBWebView\\arm64";
#elif defined(_M_X64) || defined(__x86_64__)
            path += L"EBWebView\\x64";
#else
            path += L"EBWebView\\x86";
#endif
            path += L"\\EmbeddedBrowserWebView.dll";
            if (GetFileAttributesW(path.c_str()) != INVALID_FILE_ATTRIBUTES)
            {
                return path;
            }
        }
    }
    return std::nullopt;
}

CreateInternalFn builtin_create()
{
    static std::once_flag once;
    static CreateInternalFn create = nullptr;
    std::call_once(
        once,
        []
        {
            auto path = embedded_browser_dll();
            if (!path)
            {
                WV_LOG_ERROR("no installed WebView2 runtime found under {}",
                             utils::narrow(kClientStateKey));
                return;
            }
            HMODULE module = LoadLibraryW(path->c_str());
            if (!module)
            {
                WV_LOG_ERROR("failed to load {}: {}", utils::narrow(*path),
                             utils::format_win_error_message(GetLastError()));
                return;
            }
            create = find_export<CreateInternalFn>(
                module, "CreateWebViewEnvironmentWithOptionsInternal");
            if (!create)
            {
                WV_LOG_ERROR("{} does not export the environment factory",
                             utils::narrow(*path));
                FreeLibrary(module);
            }
        });
    return create;
}

} // namespace

bool system_loader_available()
{
    auto const &exports = system_loader();
    return exports.create && exports.version && exports.compare;
}

HRESULT create_environment(
    PCWSTR browser_folder, PCWSTR user_data_folder,
    ICoreWebView2EnvironmentOptions *options,
    ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler *handler)
{
    if (auto create = system_loader().create)
    {
        return create(browser_folder, user_data_folder, options, handler);
    }
    if (browser_folder && browser_folder[0] != L'\0')
    {
        // A fixed-version runtime needs the real loader.
        return HRESULT_FROM_WIN32(ERROR_MOD_NOT_FOUND);
    }
    auto create = builtin_create();
    if (!create)
    {
        return HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND);
    }
    return create(true, 0, user_data_folder, options, handler);
}

HRESULT available_browser_version(PCWSTR browser_folder, LPWSTR *version)
{
    if (!version)
    {
        return E_POINTER;
    }
    *version = nullptr;
    if (auto query = system_loader().version)
    {
        return query(browser_folder, version);
    }
    auto installed = installed_runtime_version();
    if (!installed)
    {
        return HRESULT_FROM_WIN32(ERROR_FILE_NOT_FOUND);
    }
    auto wide = utils::widen(*installed);
    auto bytes = (wide.size() + 1) * sizeof(wchar_t);
    auto *buffer = static_cast<LPWSTR>(CoTaskMemAlloc(bytes));
    if (!buffer)
    {
        return E_OUTOFMEMORY;
    }
    std::wmemcpy(buffer, wide.c_str(), wide.size() + 1);
    *version = buffer;
    return S_OK;
}

HRESULT compare_browser_versions(PCWSTR a, PCWSTR b, int *result)
{
    if (!a || !b || !result)
    {
        return E_POINTER;
    }
    if (auto compare = system_loader().compare)
    {
        return compare(a, b, result);
    }
    auto order = compare_versions(utils::narrow(a), utils::narrow(b));
    if (!order)
    {
        return E_INVALIDARG;
    }
    *result = *order;
    return S_OK;
}

} // namespace wv::webview::loader
#endif
