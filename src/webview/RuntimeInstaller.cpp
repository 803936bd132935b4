#if defined(_WIN32)
#include "webview/RuntimeInstaller.hpp"

#include "utils/Log.hpp"
#include "utils/Registry.hpp"
#include "utils/StringUtil.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <shellapi.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <system_error>

namespace wv::webview
{

namespace
{

// Machine-wide installs live in the 32-bit registry view; per-user installs
// are not redirected.
constexpr wchar_t kClientsKey[] =
    L"SOFTWARE\\Microsoft\\EdgeUpdate\\Clients\\"
    L"{F3017226-FE2A-4295-8BDF-00C3A9A7E4C5}";

constexpr wchar_t kBootstrapperName[] = L"MicrosoftEdgeWebview2Setup.exe";
constexpr wchar_t kInstallUrl[] =
    L"https://developer.microsoft.com/en-us/microsoft-edge/webview2/"
    L"#download-section";

constexpr wchar_t kPromptTitle[] = L"Microsoft WebView2 required";
constexpr wchar_t kPromptMessage[] =
    L"This application requires the Microsoft WebView2 Runtime.\n"
    L"Press OK to install it now.";
constexpr wchar_t kErrorTitle[] = L"WebView2 installation failed";
constexpr wchar_t kFailedMessage[] =
    L"The Microsoft WebView2 Runtime was not installed correctly.\n"
    L"Check that the network is reachable and that no firewall or security "
    L"software blocks the installer, then start the application again.";

InstallResult fail(std::string message)
{
    WV_LOG_ERROR("WebView2 install: {}", message);
    MessageBoxW(nullptr, utils::widen(message).c_str(), kErrorTitle,
                MB_OK | MB_ICONERROR);
    return {false, false, std::move(message)};
}

void offer_download_page()
{
    int answer = MessageBoxW(
        nullptr,
        L"The WebView2 installer is not bundled with this application.\n"
        L"Open the download page?",
        kPromptTitle, MB_ICONEXCLAMATION | MB_YESNO | MB_DEFBUTTON1);
    if (answer == IDYES)
    {
        ShellExecuteW(nullptr, L"open", kInstallUrl, nullptr, nullptr,
                      SW_SHOWNORMAL);
    }
}

struct Bootstrapper
{
    void const *data = nullptr;
    DWORD size = 0;
};

std::optional<Bootstrapper> find_bootstrapper()
{
    HMODULE module = GetModuleHandleW(nullptr);
    HRSRC resource = FindResourceW(module, kBootstrapperResource, RT_RCDATA);
    if (!resource)
    {
        return std::nullopt;
    }
    HGLOBAL loaded = LoadResource(module, resource);
    DWORD size = SizeofResource(module, resource);
    void const *data = loaded ? LockResource(loaded) : nullptr;
    if (!data || size == 0)
    {
        return std::nullopt;
    }
    return Bootstrapper{data, size};
}

// Runs the bootstrapper and returns its exit code.
std::optional<DWORD> run_bootstrapper(std::filesystem::path const &exe,
                                      std::string &error)
{
    std::wstring command =
        L"\"" + exe.wstring() + L"\" /silent /install";
    STARTUPINFOW startup{};
    startup.cb = sizeof(startup);
    PROCESS_INFORMATION process{};
    if (!CreateProcessW(exe.c_str(), command.data(), nullptr, nullptr, FALSE,
                        0, nullptr, nullptr, &startup, &process))
    {
        error = std::format("failed to start installer: {}",
                            utils::format_win_error_message(GetLastError()));
        return std::nullopt;
    }
    WaitForSingleObject(process.hProcess, INFINITE);
    DWORD exit_code = 0;
    BOOL have_code = GetExitCodeProcess(process.hProcess, &exit_code);
    DWORD last_error = GetLastError();
    CloseHandle(process.hThread);
    CloseHandle(process.hProcess);
    if (!have_code)
    {
        error = std::format("failed to read installer exit code: {}",
                            utils::format_win_error_message(last_error));
        return std::nullopt;
    }
    return exit_code;
}

} // namespace

std::optional<std::string> installed_runtime_version()
{
    struct Location
    {
        HKEY root;
        REGSAM view;
    };
    for (auto [root, view] : {Location{HKEY_LOCAL_MACHINE, KEY_WOW64_32KEY},
                              Location{HKEY_CURRENT_USER, 0}})
    {
        if (auto version =
                utils::read_registry_string(root, kClientsKey, L"pv", view);
            version && !version->empty())
        {
            return utils::narrow(*version);
        }
    }
    return std::nullopt;
}

InstallResult ensure_runtime_installed()
{
    if (auto version = installed_runtime_version())
    {
        WV_LOG_DEBUG("WebView2 runtime {} installed", *version);
        return {true, false, {}};
    }

    int answer = MessageBoxW(nullptr, kPromptMessage, kPromptTitle,
                             MB_OKCANCEL | MB_ICONINFORMATION);
    if (answer != IDOK)
    {
        WV_LOG_WARN("WebView2 runtime missing; install declined");
        return {true, false, "install declined"};
    }

    auto bootstrapper = find_bootstrapper();
    if (!bootstrapper)
    {
        WV_LOG_ERROR("WebView2 bootstrapper resource not linked");
        offer_download_page();
        return {false, false, "bootstrapper resource missing"};
    }

    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec)
    {
        return fail(std::format("no temporary directory: {}", ec.message()));
    }
    auto exe = temp / kBootstrapperName;
    {
        std::ofstream out(exe, std::ios::binary | std::ios::trunc);
        out.write(static_cast<char const *>(bootstrapper->data),
                  static_cast<std::streamsize>(bootstrapper->size));
        if (!out)
        {
            return fail(std::format("failed to write {}", exe.string()));
        }
    }

    WV_LOG_INFO("running WebView2 bootstrapper {}", exe.string());
    std::string error;
    auto exit_code = run_bootstrapper(exe, error);
    std::filesystem::remove(exe, ec);
    if (ec)
    {
        WV_LOG_WARN("failed to remove {}: {}", exe.string(), ec.message());
    }
    if (!exit_code)
    {
        return fail(error);
    }
    if (*exit_code != 0)
    {
        WV_LOG_ERROR("WebView2 bootstrapper exited with {:#x}", *exit_code);
        MessageBoxW(nullptr, kFailedMessage, kErrorTitle, MB_OK | MB_ICONERROR);
        return {false, true, "not installed correctly"};
    }
    return {true, true, {}};
}

} // namespace wv::webview
#endif
