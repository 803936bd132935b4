#pragma once

#include <optional>
#include <string>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

namespace wv::utils
{

// REG_SZ value under root\subkey. `view` is OR-ed into the access mask
// (KEY_WOW64_32KEY / KEY_WOW64_64KEY). An empty value name reads the
// default value.
std::optional<std::wstring> read_registry_string(HKEY root,
                                                 wchar_t const *subkey,
                                                 wchar_t const *value_name,
                                                 REGSAM view = 0);

std::string format_win_error_message(DWORD code);

} // namespace wv::utils
