#pragma once

#include "rpc/Dispatcher.hpp"
#include "rpc/Message.hpp"

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <yyjson.h>

namespace wv::tests
{

// Records every script a Dispatcher evaluates or injects.
struct ScriptLog
{
    std::vector<std::string> evaluated;
    std::vector<std::string> injected;

    rpc::ScriptSink eval_sink()
    {
        return [this](std::string script)
        { evaluated.push_back(std::move(script)); };
    }

    rpc::ScriptSink inject_sink()
    {
        return [this](std::string script)
        { injected.push_back(std::move(script)); };
    }

    std::string const &last() const
    {
        if (evaluated.empty())
        {
            throw std::runtime_error("no script was evaluated");
        }
        return evaluated.back();
    }
};

inline std::string call_payload(std::int64_t id, std::string_view method,
                                std::string_view params_json)
{
    return std::format(R"({{"id":{},"method":"{}","params":{}}})", id, method,
                       params_json);
}

// Holds a parsed document for handing single values to codecs.
class JsonValue
{
  public:
    explicit JsonValue(std::string_view text)
        : doc_(wv::json::Document::parse(text))
    {
        if (!doc_.is_valid())
        {
            throw std::runtime_error("test JSON does not parse");
        }
    }

    yyjson_val *get() const noexcept { return doc_.root(); }

  private:
    wv::json::Document doc_;
};

} // namespace wv::tests
