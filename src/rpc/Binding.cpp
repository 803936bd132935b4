#include "rpc/Binding.hpp"

#include <cstdlib>
#include <string>

#include <yyjson.h>

namespace wv::rpc
{

CallOutcome finish_encoding(yyjson_mut_val *root)
{
    if (root == nullptr)
    {
        return CallOutcome::rejected("json: failed to encode result");
    }
    yyjson_write_err err{};
    size_t length = 0;
    char *json = yyjson_mut_val_write_opts(root, 0, nullptr, &length, &err);
    if (json == nullptr)
    {
        return CallOutcome::rejected(
            std::string("json: ") +
            (err.msg ? err.msg : "unsupported value"));
    }
    std::string text(json, length);
    std::free(json);
    return CallOutcome::resolved(std::move(text));
}

} // namespace wv::rpc
