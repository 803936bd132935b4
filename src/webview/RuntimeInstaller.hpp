#pragma once

#include <optional>
#include <string>

namespace wv::webview
{

struct InstallResult
{
    bool success = false;
    // True when the bootstrapper ran during this call.
    bool installed = false;
    std::string message;
};

// Resource name of the Evergreen bootstrapper linked into the application
// as RCDATA.
inline constexpr wchar_t kBootstrapperResource[] = L"WEBVIEW2_BOOTSTRAPPER";

// The runtime's "pv" registry value; nullopt when not installed.
std::optional<std::string> installed_runtime_version();

// Installs the runtime when it is missing, after asking the user. Declining
// the prompt counts as success: the caller carries on and window creation
// reports the missing runtime.
InstallResult ensure_runtime_installed();

} // namespace wv::webview
