#include "rpc/Message.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include <yyjson.h>

namespace wv::rpc
{

namespace
{

constexpr char kBootstrapBody[] = R"js(
  var rpc = window._rpc = (window._rpc || {nextSeq: 1});
  window[name] = function() {
    var seq = rpc.nextSeq++;
    var promise = new Promise(function(resolve, reject) {
      rpc[seq] = {resolve: resolve, reject: reject};
    });
    window.external.invoke(JSON.stringify({
      id: seq,
      method: name,
      params: Array.prototype.slice.call(arguments)
    }));
    return promise;
  };
})();)js";

std::string settle_script(std::int64_t id, char const *action,
                          std::string_view argument)
{
    auto slot = "window._rpc[" + std::to_string(id) + "]";
    std::string script;
    script.reserve(64 + argument.size());
    script.append(slot).append(".").append(action).append("(");
    script.append(argument);
    script.append("); ").append(slot).append(" = undefined");
    return script;
}

} // namespace

std::optional<CallRequest> parse_call(std::string_view payload,
                                      std::string &error)
{
    if (payload.empty())
    {
        error = "empty RPC payload";
        return std::nullopt;
    }
    auto doc = wv::json::Document::parse(payload);
    if (!doc.is_valid())
    {
        error = "invalid JSON";
        return std::nullopt;
    }
    yyjson_val *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        error = "expected JSON object";
        return std::nullopt;
    }

    CallRequest request;
    if (auto *id = yyjson_obj_get(root, "id"); id && !yyjson_is_null(id))
    {
        // Slot numbers are signed; larger unsigned ids do not fit one.
        if (!yyjson_is_int(id) ||
            (yyjson_is_uint(id) &&
             yyjson_get_uint(id) >
                 static_cast<std::uint64_t>(
                     std::numeric_limits<std::int64_t>::max())))
        {
            error = "id is not an integer";
            return std::nullopt;
        }
        request.id = yyjson_is_sint(id)
                         ? yyjson_get_sint(id)
                         : static_cast<std::int64_t>(yyjson_get_uint(id));
    }
    if (auto *method = yyjson_obj_get(root, "method");
        method && !yyjson_is_null(method))
    {
        if (!yyjson_is_str(method))
        {
            error = "method is not a string";
            return std::nullopt;
        }
        request.method.assign(yyjson_get_str(method), yyjson_get_len(method));
    }
    if (auto *params = yyjson_obj_get(root, "params");
        params && !yyjson_is_null(params))
    {
        if (!yyjson_is_arr(params))
        {
            error = "params is not an array";
            return std::nullopt;
        }
        request.params.reserve(yyjson_arr_size(params));
        size_t idx, limit;
        yyjson_val *value = nullptr;
        yyjson_arr_foreach(params, idx, limit, value)
        {
            request.params.push_back(value);
        }
    }
    request.document = std::move(doc);
    return request;
}

std::string resolve_script(std::int64_t id, std::string_view result_json)
{
    return settle_script(id, "resolve", result_json);
}

std::string reject_script(std::int64_t id, std::string_view message)
{
    return settle_script(id, "reject", wv::json::quote(message));
}

std::string bootstrap_script(std::string_view name)
{
    std::string script = "(function() {\n  var name = ";
    script.append(wv::json::quote(name));
    script.append(";");
    script.append(kBootstrapBody);
    return script;
}

} // namespace wv::rpc
