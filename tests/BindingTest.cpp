#include "RpcTestUtils.hpp"
#include "rpc/Binding.hpp"
#include "rpc/BindingTable.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace wv::tests;

int triple(int value)
{
    return value * 3;
}

struct Counter
{
    int base = 10;
    int operator()(int step) const { return base + step; }
};

} // namespace

TEST_CASE("make_binding records arity and variadic shape")
{
    auto fixed = wv::rpc::make_binding(&triple);
    CHECK(fixed.arity == 1);
    CHECK_FALSE(fixed.variadic);
    CHECK(fixed.accepts(1));
    CHECK_FALSE(fixed.accepts(0));
    CHECK_FALSE(fixed.accepts(2));

    auto variadic = wv::rpc::make_binding(
        [](std::string const &, int, wv::rpc::Variadic<double> const &) {});
    CHECK(variadic.arity == 3);
    CHECK(variadic.variadic);
    CHECK_FALSE(variadic.accepts(1));
    CHECK(variadic.accepts(2));
    CHECK(variadic.accepts(6));

    auto functor = wv::rpc::make_binding(Counter{});
    CHECK(functor.arity == 1);
}

TEST_CASE("invoke decodes params and encodes the result")
{
    JsonValue params("[4]");
    wv::rpc::Params list{yyjson_arr_get(params.get(), 0)};

    auto outcome = wv::rpc::make_binding(&triple).invoke(list);
    CHECK(outcome.status == wv::rpc::CallStatus::Resolved);
    CHECK(outcome.payload == "12");

    auto counted = wv::rpc::make_binding(Counter{5}).invoke(list);
    CHECK(counted.payload == "9");
}

TEST_CASE("mutable lambdas keep their state between calls")
{
    auto binding = wv::rpc::make_binding([count = 0]() mutable
                                         { return ++count; });
    wv::rpc::Params none;
    CHECK(binding.invoke(none).payload == "1");
    CHECK(binding.invoke(none).payload == "2");
}

TEST_CASE("binding table replaces entries and lists names")
{
    wv::rpc::BindingTable table;
    CHECK(table.size() == 0);
    CHECK_FALSE(table.bind("b", wv::rpc::make_binding(&triple)));
    CHECK_FALSE(table.bind("a", wv::rpc::make_binding([]() {})));

    auto before = table.find("b");
    REQUIRE(before != nullptr);
    CHECK(table.bind("b", wv::rpc::make_binding([]() { return 0; })));

    CHECK(table.size() == 2);
    CHECK(table.contains("a"));
    CHECK_FALSE(table.contains("c"));
    CHECK(table.find("c") == nullptr);
    std::vector<std::string> const expected{"a", "b"};
    CHECK(table.names() == expected);

    // The snapshot taken before re-binding still describes the old entry.
    CHECK(before->arity == 1);
    CHECK(table.find("b")->arity == 0);
}

TEST_CASE("snapshots stay callable while another thread re-binds the name")
{
    wv::rpc::BindingTable table;
    table.bind("value", wv::rpc::make_binding([]() { return 1; }));
    auto held = table.find("value");
    REQUIRE(held != nullptr);

    constexpr int kRounds = 2000;
    std::atomic<bool> done{false};
    std::thread rebinder(
        [&]
        {
            for (int i = 0; i < kRounds; ++i)
            {
                int result = i % 2 == 0 ? 2 : 1;
                table.bind("value", wv::rpc::make_binding([result]()
                                                          { return result; }));
            }
            done = true;
        });

    wv::rpc::Params none;
    int calls = 0;
    int unexpected = 0;
    while (!done || calls == 0)
    {
        auto snapshot = table.find("value");
        if (!snapshot)
        {
            ++unexpected;
            continue;
        }
        auto outcome = snapshot->invoke(none);
        if (outcome.status != wv::rpc::CallStatus::Resolved ||
            (outcome.payload != "1" && outcome.payload != "2"))
        {
            ++unexpected;
        }
        ++calls;
    }
    rebinder.join();

    CHECK(unexpected == 0);
    CHECK(calls > 0);
    CHECK(table.size() == 1);
    // The entry taken before any re-binding still runs the original callable.
    CHECK(held->invoke(none).payload == "1");
    CHECK(table.find("value")->invoke(none).payload == "1");
}
