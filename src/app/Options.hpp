#pragma once

#include "rpc/Dispatcher.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace wv::app
{

enum class Hint
{
    // Width and height are the default size.
    None,
    // Width and height are the minimum bounds.
    Min,
    // Width and height are the maximum bounds.
    Max,
    // The window size can not be changed by the user.
    Fixed,
};

struct WindowOptions
{
    std::string title;
    // 0 selects 640x480.
    unsigned width = 0;
    unsigned height = 0;
    // Icon resource id in the executable; 0 loads the default application
    // icon.
    unsigned icon_id = 0;
    bool center = false;
};

struct WebViewOptions
{
    // Enables context menus and developer tools.
    bool debug = false;
    // Browser profile directory. Empty selects <data root>/WebView2.
    std::string data_path;
    // Keeps the browser focused whenever the window is activated.
    bool auto_focus = false;
    WindowOptions window;
    rpc::UnknownMethodPolicy unknown_methods = rpc::UnknownMethodPolicy::Ignore;
};

using EnvReader = std::function<std::optional<std::string>(char const *)>;

// Accepts 1/0/true/false/yes/no in any case.
std::optional<bool> parse_bool(std::string_view value);

std::optional<rpc::UnknownMethodPolicy>
parse_unknown_method_policy(std::string_view value);

// Layers WV_DEBUG, WV_DATA_PATH, WV_AUTOFOCUS and WV_UNKNOWN_METHOD on top
// of `options`. Values that do not parse leave the option untouched.
// `read_env` defaults to the process environment.
WebViewOptions apply_environment(WebViewOptions options,
                                 EnvReader const &read_env = {});

std::filesystem::path resolve_data_path(WebViewOptions const &options);

} // namespace wv::app
