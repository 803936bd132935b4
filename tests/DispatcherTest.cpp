#include "RpcTestUtils.hpp"
#include "app/DispatchQueue.hpp"
#include "rpc/Dispatcher.hpp"

#include <doctest/doctest.h>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace wv::tests;
using wv::rpc::Dispatcher;
using wv::rpc::reject_script;
using wv::rpc::resolve_script;

} // namespace

TEST_CASE("fixed arity call receives decoded params in order")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    std::vector<std::string> seen;
    dispatcher.bind("join",
                    [&seen](std::string const &a, int b, bool c)
                    {
                        seen.push_back(a);
                        seen.push_back(std::to_string(b));
                        seen.push_back(c ? "yes" : "no");
                        return a + std::to_string(b);
                    });

    dispatcher.dispatch(call_payload(1, "join", R"(["x", 7, true])"));

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == "x");
    CHECK(seen[1] == "7");
    CHECK(seen[2] == "yes");
    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == resolve_script(1, R"("x7")"));
}

TEST_CASE("arity mismatch rejects without invoking")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    int calls = 0;
    dispatcher.bind("pair", [&calls](int, int) { ++calls; });

    dispatcher.dispatch(call_payload(2, "pair", "[1]"));
    dispatcher.dispatch(call_payload(3, "pair", "[1, 2, 3]"));

    CHECK(calls == 0);
    REQUIRE(log.evaluated.size() == 2);
    CHECK(log.evaluated[0] ==
          reject_script(2, "function arguments mismatch"));
    CHECK(log.evaluated[1] ==
          reject_script(3, "function arguments mismatch"));
}

TEST_CASE("variadic callable accepts N-1 or more params")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    int calls = 0;
    dispatcher.bind("count",
                    [&calls](std::string const &label,
                             wv::rpc::Variadic<int> const &values)
                    {
                        ++calls;
                        int total = 0;
                        for (int value : values)
                        {
                            total += value;
                        }
                        return label + "=" + std::to_string(total);
                    });

    dispatcher.dispatch(call_payload(1, "count", R"(["none"])"));
    dispatcher.dispatch(call_payload(2, "count", R"(["sum", 1, 2, 3])"));
    dispatcher.dispatch(call_payload(3, "count", "[]"));

    CHECK(calls == 2);
    REQUIRE(log.evaluated.size() == 3);
    CHECK(log.evaluated[0] == resolve_script(1, R"("none=0")"));
    CHECK(log.evaluated[1] == resolve_script(2, R"("sum=6")"));
    CHECK(log.evaluated[2] ==
          reject_script(3, "function arguments mismatch"));
}

TEST_CASE("value and error returns settle the promise")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("half",
                    [](int value) -> wv::rpc::Result<int>
                    {
                        if (value % 2 != 0)
                        {
                            return {0, wv::rpc::Error{"odd input"}};
                        }
                        return {value / 2, std::nullopt};
                    });

    dispatcher.dispatch(call_payload(1, "half", "[8]"));
    dispatcher.dispatch(call_payload(2, "half", "[7]"));

    REQUIRE(log.evaluated.size() == 2);
    CHECK(log.evaluated[0] == resolve_script(1, "4"));
    CHECK(log.evaluated[1] == reject_script(2, "odd input"));
}

TEST_CASE("error-only returns resolve null or reject")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("check",
                    [](bool ok) -> wv::rpc::Status
                    {
                        if (ok)
                        {
                            return std::nullopt;
                        }
                        return wv::rpc::Error{"check failed"};
                    });

    dispatcher.dispatch(call_payload(1, "check", "[true]"));
    dispatcher.dispatch(call_payload(2, "check", "[false]"));

    REQUIRE(log.evaluated.size() == 2);
    CHECK(log.evaluated[0] == resolve_script(1, "null"));
    CHECK(log.evaluated[1] == reject_script(2, "check failed"));
}

TEST_CASE("void callable resolves null")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    int calls = 0;
    dispatcher.bind("ping", [&calls]() { ++calls; });

    dispatcher.dispatch(R"({"id":5,"method":"ping"})");

    CHECK(calls == 1);
    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == resolve_script(5, "null"));
}

TEST_CASE("unknown method is ignored by default")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("known", []() { return 1; });

    dispatcher.dispatch(call_payload(1, "missing", "[]"));

    CHECK(log.evaluated.empty());
    CHECK(dispatcher.unknown_method_policy() ==
          wv::rpc::UnknownMethodPolicy::Ignore);
}

TEST_CASE("unknown method rejects under the reject policy")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink(), {},
                          wv::rpc::UnknownMethodPolicy::Reject};

    dispatcher.dispatch(call_payload(9, "missing", "[]"));

    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == reject_script(9, "unknown method: missing"));

    dispatcher.set_unknown_method_policy(wv::rpc::UnknownMethodPolicy::Ignore);
    dispatcher.dispatch(call_payload(10, "missing", "[]"));
    CHECK(log.evaluated.size() == 1);
}

TEST_CASE("re-binding replaces the earlier callable")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("version", []() { return 1; });
    dispatcher.bind("version", []() { return 2; });

    dispatcher.dispatch(call_payload(1, "version", "[]"));

    CHECK(dispatcher.bindings().size() == 1);
    CHECK(log.injected.size() == 2);
    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == resolve_script(1, "2"));
}

TEST_CASE("each bind injects one bootstrap script")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("first", []() {});
    dispatcher.bind("second", [](int value) { return value; });

    REQUIRE(log.injected.size() == 2);
    CHECK(log.injected[0] == wv::rpc::bootstrap_script("first"));
    CHECK(log.injected[1] == wv::rpc::bootstrap_script("second"));
    std::vector<std::string> const expected{"first", "second"};
    CHECK(dispatcher.bindings().names() == expected);
}

TEST_CASE("binding without a callable is refused")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind_binding("empty", wv::rpc::Binding{});

    CHECK(log.injected.empty());
    CHECK_FALSE(dispatcher.bindings().contains("empty"));
}

TEST_CASE("decode mismatch rejects before the callable runs")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    int calls = 0;
    dispatcher.bind("pair",
                    [&calls](int, std::vector<int> const &)
                    {
                        ++calls;
                        return true;
                    });

    dispatcher.dispatch(call_payload(1, "pair", R"(["one", [1]])"));
    dispatcher.dispatch(call_payload(2, "pair", R"([1, [1, "two"]])"));

    CHECK(calls == 0);
    REQUIRE(log.evaluated.size() == 2);
    CHECK(log.evaluated[0] ==
          reject_script(1, "param 0: cannot decode string into integer"));
    CHECK(log.evaluated[1] ==
          reject_script(2, "param 1: [1]: cannot decode string into integer"));
}

TEST_CASE("exceptions from the callable reject the call")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("explode",
                    []() -> int { throw std::runtime_error("kaboom"); });

    dispatcher.dispatch(call_payload(4, "explode", "[]"));

    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == reject_script(4, "kaboom"));
}

TEST_CASE("invalid messages produce no script")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink(), {},
                          wv::rpc::UnknownMethodPolicy::Reject};
    dispatcher.bind("noop", []() {});

    dispatcher.dispatch("");
    dispatcher.dispatch("{");
    dispatcher.dispatch("[1, 2]");
    dispatcher.dispatch(R"({"id":"1","method":"noop"})");
    dispatcher.dispatch(R"({"id":1,"method":"noop","params":{}})");

    CHECK(log.evaluated.empty());
}

TEST_CASE("structured results are marshalled as JSON")
{
    ScriptLog log;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink()};
    dispatcher.bind("table",
                    []()
                    {
                        return std::map<std::string, std::vector<int>>{
                            {"a", {1, 2}}, {"b", {}}};
                    });
    dispatcher.bind("echo",
                    [](wv::rpc::RawJson const &value) { return value; });

    dispatcher.dispatch(call_payload(1, "table", "[]"));
    dispatcher.dispatch(call_payload(2, "echo", R"([{"k":[true,null]}])"));

    REQUIRE(log.evaluated.size() == 2);
    CHECK(log.evaluated[0] == resolve_script(1, R"({"a":[1,2],"b":[]})"));
    CHECK(log.evaluated[1] == resolve_script(2, R"({"k":[true,null]})"));
}

TEST_CASE("responses wait for the dispatch queue")
{
    ScriptLog log;
    wv::app::DispatchQueue queue;
    Dispatcher dispatcher{log.eval_sink(), log.inject_sink(),
                          [&queue](std::function<void()> task)
                          { queue.post(std::move(task)); }};
    dispatcher.bind("double", [](int value) { return value * 2; });

    dispatcher.dispatch(call_payload(1, "double", "[21]"));

    CHECK(log.evaluated.empty());
    CHECK(queue.pending() == 1);
    CHECK(queue.drain() == 1);
    REQUIRE(log.evaluated.size() == 1);
    CHECK(log.last() == resolve_script(1, "42"));
}
