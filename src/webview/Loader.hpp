#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <webview2.h>

// Entry points of WebView2Loader.dll, resolved at run time. When the DLL is
// not on the search path the installed runtime is driven directly.
namespace wv::webview::loader
{

HRESULT create_environment(
    PCWSTR browser_folder, PCWSTR user_data_folder,
    ICoreWebView2EnvironmentOptions *options,
    ICoreWebView2CreateCoreWebView2EnvironmentCompletedHandler *handler);

// On success *version is allocated with CoTaskMemAlloc.
HRESULT available_browser_version(PCWSTR browser_folder, LPWSTR *version);

HRESULT compare_browser_versions(PCWSTR a, PCWSTR b, int *result);

// True when WebView2Loader.dll was found and exports every entry point.
bool system_loader_available();

} // namespace wv::webview::loader
