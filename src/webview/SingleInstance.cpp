#if defined(_WIN32)
#include "webview/SingleInstance.hpp"

#include "utils/Log.hpp"
#include "utils/Registry.hpp"
#include "utils/StringUtil.hpp"

#include <Windows.h>

namespace wv::webview
{

SingleInstanceLock::SingleInstanceLock(std::string const &name)
{
    auto wide = utils::widen("Local\\" + name);
    HANDLE mutex = CreateMutexW(nullptr, TRUE, wide.c_str());
    DWORD error = GetLastError();
    if (!mutex)
    {
        WV_LOG_ERROR("CreateMutex({}) failed: {}", name,
                     utils::format_win_error_message(error));
        return;
    }
    handle_ = mutex;
    acquired_ = error != ERROR_ALREADY_EXISTS;
    if (!acquired_)
    {
        WV_LOG_INFO("another instance holds {}", name);
    }
}

SingleInstanceLock::~SingleInstanceLock()
{
    if (!handle_)
    {
        return;
    }
    if (acquired_)
    {
        ReleaseMutex(static_cast<HANDLE>(handle_));
    }
    CloseHandle(static_cast<HANDLE>(handle_));
}

} // namespace wv::webview
#endif
