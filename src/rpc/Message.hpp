#pragma once

#include "rpc/Binding.hpp"
#include "utils/Json.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wv::rpc
{

// One inbound call: {"id": <int>, "method": <string>, "params": [...]}.
// `params` point into `document`.
struct CallRequest
{
    std::int64_t id = 0;
    std::string method;
    Params params;
    wv::json::Document document;
};

// Parses an inbound call. On failure returns nullopt and fills `error`.
std::optional<CallRequest> parse_call(std::string_view payload,
                                      std::string &error);

// Script settling the page-side promise stored at window._rpc[id].
std::string resolve_script(std::int64_t id, std::string_view result_json);
std::string reject_script(std::int64_t id, std::string_view message);

// Script defining window[name] as a promise-returning proxy that forwards
// its arguments through window.external.invoke.
std::string bootstrap_script(std::string_view name);

} // namespace wv::rpc
