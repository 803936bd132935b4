#include "rpc/Message.hpp"

#include <doctest/doctest.h>

#include <string>

#include <yyjson.h>

namespace
{

std::string parse_error(std::string const &payload)
{
    std::string error;
    auto request = wv::rpc::parse_call(payload, error);
    CHECK_FALSE(request.has_value());
    return error;
}

} // namespace

TEST_CASE("parse_call reads id, method and params")
{
    std::string error;
    auto request = wv::rpc::parse_call(
        R"({"id": 12, "method": "add", "params": [1, "two", null]})", error);
    REQUIRE(request.has_value());
    CHECK(error.empty());
    CHECK(request->id == 12);
    CHECK(request->method == "add");
    REQUIRE(request->params.size() == 3);
    CHECK(yyjson_get_int(request->params[0]) == 1);
    CHECK(std::string(yyjson_get_str(request->params[1])) == "two");
    CHECK(yyjson_is_null(request->params[2]));
}

TEST_CASE("parse_call defaults missing fields")
{
    std::string error;
    auto request = wv::rpc::parse_call(R"({"method": "ping"})", error);
    REQUIRE(request.has_value());
    CHECK(request->id == 0);
    CHECK(request->method == "ping");
    CHECK(request->params.empty());

    auto nulls = wv::rpc::parse_call(
        R"({"id": null, "method": "ping", "params": null})", error);
    REQUIRE(nulls.has_value());
    CHECK(nulls->params.empty());
}

TEST_CASE("parse_call rejects malformed messages")
{
    CHECK(parse_error("") == "empty RPC payload");
    CHECK(parse_error("{\"id\":") == "invalid JSON");
    CHECK(parse_error("[]") == "expected JSON object");
    CHECK(parse_error(R"({"id": 1.5})") == "id is not an integer");
    CHECK(parse_error(R"({"id": 1, "method": 3})") == "method is not a string");
    CHECK(parse_error(R"({"id": 1, "params": {"a": 1}})") ==
          "params is not an array");
}

TEST_CASE("settle scripts address the pending promise slot")
{
    CHECK(wv::rpc::resolve_script(3, "42") ==
          "window._rpc[3].resolve(42); window._rpc[3] = undefined");
    CHECK(wv::rpc::reject_script(7, "bad \"input\"") ==
          R"(window._rpc[7].reject("bad \"input\""); window._rpc[7] = undefined)");
}

TEST_CASE("bootstrap script defines the named proxy")
{
    auto script = wv::rpc::bootstrap_script("say\"hi");
    CHECK(script.rfind("(function() {\n  var name = \"say\\\"hi\";", 0) == 0);
    CHECK(script.find("window._rpc = (window._rpc || {nextSeq: 1})") !=
          std::string::npos);
    CHECK(script.find("window.external.invoke(JSON.stringify(") !=
          std::string::npos);
    CHECK(script.find("})();") != std::string::npos);
}

TEST_CASE("parse_call accepts the full signed id range only")
{
    std::string error;
    auto largest = wv::rpc::parse_call(
        R"({"id": 9223372036854775807, "method": "ping"})", error);
    REQUIRE(largest.has_value());
    CHECK(largest->id == 9223372036854775807LL);

    auto negative = wv::rpc::parse_call(R"({"id": -4, "method": "ping"})",
                                        error);
    REQUIRE(negative.has_value());
    CHECK(negative->id == -4);

    CHECK(parse_error(R"({"id": 9223372036854775808, "method": "ping"})") ==
          "id is not an integer");
    CHECK(parse_error(R"({"id": 18446744073709551615, "method": "ping"})") ==
          "id is not an integer");
}

TEST_CASE("reject script keeps messages that are not valid UTF-8")
{
    std::string message = "bad byte \xff here";
    auto script = wv::rpc::reject_script(2, message);
    CHECK(script.find("bad byte ") != std::string::npos);
    CHECK(script.find(" here") != std::string::npos);
    CHECK(script.find(".reject(\"\")") == std::string::npos);
}
