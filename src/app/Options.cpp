#include "app/Options.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace wv::app
{

namespace
{

std::string trim_whitespace(std::string_view value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::optional<std::string> read_process_env(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

std::optional<bool> parse_bool(std::string_view value)
{
    auto lowercase = to_lower(trim_whitespace(value));
    if (lowercase == "1" || lowercase == "true" || lowercase == "yes")
    {
        return true;
    }
    if (lowercase == "0" || lowercase == "false" || lowercase == "no")
    {
        return false;
    }
    return std::nullopt;
}

std::optional<rpc::UnknownMethodPolicy>
parse_unknown_method_policy(std::string_view value)
{
    auto lowercase = to_lower(trim_whitespace(value));
    if (lowercase == "ignore")
    {
        return rpc::UnknownMethodPolicy::Ignore;
    }
    if (lowercase == "reject")
    {
        return rpc::UnknownMethodPolicy::Reject;
    }
    return std::nullopt;
}

WebViewOptions apply_environment(WebViewOptions options,
                                 EnvReader const &read_env)
{
    auto read = [&](char const *key) -> std::optional<std::string>
    { return read_env ? read_env(key) : read_process_env(key); };

    auto apply_bool = [&](char const *key, bool &target)
    {
        auto raw = read(key);
        if (!raw)
        {
            return;
        }
        if (auto parsed = parse_bool(*raw))
        {
            target = *parsed;
        }
        else
        {
            WV_LOG_WARN("ignoring {}={}: not a boolean", key, *raw);
        }
    };

    apply_bool("WV_DEBUG", options.debug);
    apply_bool("WV_AUTOFOCUS", options.auto_focus);

    if (auto path = read("WV_DATA_PATH"))
    {
        auto trimmed = trim_whitespace(*path);
        if (!trimmed.empty())
        {
            options.data_path = std::move(trimmed);
        }
    }

    if (auto raw = read("WV_UNKNOWN_METHOD"))
    {
        if (auto policy = parse_unknown_method_policy(*raw))
        {
            options.unknown_methods = *policy;
        }
        else
        {
            WV_LOG_WARN("ignoring WV_UNKNOWN_METHOD={}", *raw);
        }
    }
    return options;
}

std::filesystem::path resolve_data_path(WebViewOptions const &options)
{
    if (!options.data_path.empty())
    {
        return std::filesystem::path(options.data_path);
    }
    return wv::utils::data_root() / "WebView2";
}

} // namespace wv::app
