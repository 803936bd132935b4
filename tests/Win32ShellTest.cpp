#if defined(_WIN32)
// Windows.h comes in first, through the shell headers, so the codecs below
// are compiled with the Win32 macros in scope.
#include "webview/RuntimeInstaller.hpp"
#include "webview/Win32WebView.hpp"

#include "RpcTestUtils.hpp"
#include "rpc/Codec.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <limits>
#include <string>

namespace
{

using namespace wv::tests;

constexpr wchar_t kScratchKey[] = L"Software\\wvbridge-tests";
constexpr wchar_t kClientsKey[] =
    L"SOFTWARE\\Microsoft\\EdgeUpdate\\Clients\\"
    L"{F3017226-FE2A-4295-8BDF-00C3A9A7E4C5}";
constexpr wchar_t kRedirectedClientsKey[] =
    L"SOFTWARE\\WOW6432Node\\Microsoft\\EdgeUpdate\\Clients\\"
    L"{F3017226-FE2A-4295-8BDF-00C3A9A7E4C5}";

HKEY create_key(HKEY root, wchar_t const *subkey)
{
    HKEY key = nullptr;
    auto status = RegCreateKeyExW(root, subkey, 0, nullptr, 0, KEY_ALL_ACCESS,
                                  nullptr, &key, nullptr);
    REQUIRE(status == ERROR_SUCCESS);
    return key;
}

void write_pv(HKEY root, wchar_t const *subkey, std::wstring const &version)
{
    HKEY key = create_key(root, subkey);
    auto status = RegSetValueExW(
        key, L"pv", 0, REG_SZ, reinterpret_cast<BYTE const *>(version.c_str()),
        static_cast<DWORD>((version.size() + 1) * sizeof(wchar_t)));
    RegCloseKey(key);
    REQUIRE(status == ERROR_SUCCESS);
}

// Points HKLM and HKCU at empty scratch keys for the lifetime of the object.
class ScratchRegistry
{
  public:
    ScratchRegistry()
    {
        RegDeleteTreeW(HKEY_CURRENT_USER, kScratchKey);
        machine_ = create_key(HKEY_CURRENT_USER,
                              L"Software\\wvbridge-tests\\machine");
        user_ = create_key(HKEY_CURRENT_USER, L"Software\\wvbridge-tests\\user");
        REQUIRE(RegOverridePredefKey(HKEY_LOCAL_MACHINE, machine_) ==
                ERROR_SUCCESS);
        REQUIRE(RegOverridePredefKey(HKEY_CURRENT_USER, user_) ==
                ERROR_SUCCESS);
    }

    ~ScratchRegistry()
    {
        RegOverridePredefKey(HKEY_CURRENT_USER, nullptr);
        RegOverridePredefKey(HKEY_LOCAL_MACHINE, nullptr);
        RegCloseKey(user_);
        RegCloseKey(machine_);
        RegDeleteTreeW(HKEY_CURRENT_USER, kScratchKey);
    }

    ScratchRegistry(ScratchRegistry const &) = delete;
    ScratchRegistry &operator=(ScratchRegistry const &) = delete;

    HKEY machine() const { return machine_; }
    HKEY user() const { return user_; }

  private:
    HKEY machine_ = nullptr;
    HKEY user_ = nullptr;
};

} // namespace

TEST_CASE("integer codecs compile with the Win32 headers in scope")
{
    JsonValue big("4294967296");
    CHECK_THROWS_AS(wv::rpc::decode_value<std::int32_t>(big.get()),
                    wv::rpc::DecodeError);
    JsonValue low("-1");
    CHECK_THROWS_AS(wv::rpc::decode_value<std::uint16_t>(low.get()),
                    wv::rpc::DecodeError);
    CHECK(std::numeric_limits<std::int32_t>::max() == 2147483647);
}

TEST_CASE("handled window messages do not reach DefWindowProc")
{
    CHECK(wv::webview::consumes_window_message(WM_ACTIVATE));
    CHECK(wv::webview::consumes_window_message(WM_SIZE));
    CHECK(wv::webview::consumes_window_message(WM_MOVE));
    CHECK(wv::webview::consumes_window_message(WM_MOVING));
    CHECK(wv::webview::consumes_window_message(WM_GETMINMAXINFO));
    CHECK(wv::webview::consumes_window_message(WM_CLOSE));
    CHECK(wv::webview::consumes_window_message(WM_DESTROY));

    CHECK_FALSE(wv::webview::consumes_window_message(WM_NCLBUTTONDOWN));
    CHECK_FALSE(wv::webview::consumes_window_message(WM_PAINT));
    CHECK_FALSE(wv::webview::consumes_window_message(WM_KEYDOWN));
}

TEST_CASE("runtime version is found in a per-user install")
{
    ScratchRegistry registry;
    write_pv(registry.user(), kClientsKey, L"120.0.2210.91");

    auto version = wv::webview::installed_runtime_version();
    REQUIRE(version.has_value());
    CHECK(*version == "120.0.2210.91");
}

TEST_CASE("machine-wide runtime version wins over the per-user one")
{
    ScratchRegistry registry;
    write_pv(registry.machine(), kClientsKey, L"121.0.2277.83");
    write_pv(registry.user(), kClientsKey, L"120.0.2210.91");

    auto version = wv::webview::installed_runtime_version();
    REQUIRE(version.has_value());
    CHECK(*version == "121.0.2277.83");
}

TEST_CASE("per-user entries under WOW6432Node are not an install")
{
    ScratchRegistry registry;
    write_pv(registry.user(), kRedirectedClientsKey, L"120.0.2210.91");

    CHECK_FALSE(wv::webview::installed_runtime_version().has_value());
}
#endif
