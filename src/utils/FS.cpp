#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <ShlObj.h>
#else
#include <unistd.h>
#endif

namespace wv::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
#if defined(_WIN32)
    std::vector<wchar_t> buffer(32768);
    while (true)
    {
        DWORD length = GetModuleFileNameW(nullptr, buffer.data(),
                                          static_cast<DWORD>(buffer.size()));
        if (length == 0)
        {
            return std::nullopt;
        }
        if (length < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        if (buffer.size() >= (1 << 16))
        {
            return std::nullopt;
        }
        buffer.resize(buffer.size() * 2);
    }
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

std::optional<std::filesystem::path> app_data_root()
{
#if defined(_WIN32)
    PWSTR local_app = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_LocalAppData, KF_FLAG_CREATE,
                                       nullptr, &local_app)) &&
        local_app)
    {
        std::filesystem::path path(local_app);
        CoTaskMemFree(local_app);
        path /= "wvbridge";
        if (auto ensured = ensure_directory(path))
        {
            return *ensured;
        }
    }
#else
    if (char const *xdg = std::getenv("XDG_DATA_HOME"); xdg && xdg[0] != '\0')
    {
        if (auto ensured =
                ensure_directory(std::filesystem::path(xdg) / "wvbridge"))
        {
            return *ensured;
        }
    }
    if (char const *home = std::getenv("HOME"); home && home[0] != '\0')
    {
        if (auto ensured = ensure_directory(std::filesystem::path(home) /
                                            ".local" / "share" / "wvbridge"))
        {
            return *ensured;
        }
    }
#endif
    return std::nullopt;
}

std::filesystem::path data_root()
{
    if (auto appdata = app_data_root())
    {
        return *appdata;
    }
    return fallback_root();
}

} // namespace wv::utils
