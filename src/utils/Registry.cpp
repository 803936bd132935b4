#if defined(_WIN32)
#include "utils/Registry.hpp"

#include <system_error>
#include <vector>

namespace wv::utils
{

namespace
{

std::wstring reg_sz_to_wstring(std::vector<wchar_t> &buffer, DWORD size_bytes)
{
    if (buffer.empty())
    {
        return {};
    }

    auto written = static_cast<std::size_t>(size_bytes / sizeof(wchar_t));
    if (written >= buffer.size())
    {
        written = buffer.size() - 1;
    }
    buffer[written] = L'\0';
    while (written > 0 && buffer[written - 1] == L'\0')
    {
        --written;
    }
    return std::wstring(buffer.data(), buffer.data() + written);
}

} // namespace

std::optional<std::wstring> read_registry_string(HKEY root,
                                                 wchar_t const *subkey,
                                                 wchar_t const *value_name,
                                                 REGSAM view)
{
    HKEY key = nullptr;
    auto status = RegOpenKeyExW(root, subkey, 0, KEY_READ | view, &key);
    if (status != ERROR_SUCCESS)
    {
        return std::nullopt;
    }

    DWORD type = 0;
    DWORD size = 0;
    auto name = value_name && value_name[0] != L'\0' ? value_name : nullptr;
    status = RegQueryValueExW(key, name, nullptr, &type, nullptr, &size);
    if (status != ERROR_SUCCESS || type != REG_SZ || size == 0)
    {
        RegCloseKey(key);
        return std::nullopt;
    }

    std::vector<wchar_t> buffer(size / sizeof(wchar_t) + 1ull, L'\0');
    status = RegQueryValueExW(key, name, nullptr, nullptr,
                              reinterpret_cast<LPBYTE>(buffer.data()), &size);
    RegCloseKey(key);
    if (status != ERROR_SUCCESS)
    {
        return std::nullopt;
    }

    return reg_sz_to_wstring(buffer, size);
}

std::string format_win_error_message(DWORD code)
{
    std::error_code ec(static_cast<int>(code), std::system_category());
    return ec.message();
}

} // namespace wv::utils
#endif
