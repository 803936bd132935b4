#pragma once

#include "rpc/Codec.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace wv::rpc
{

struct Error
{
    std::string message;
};

// Error-shaped return: empty means success.
using Status = std::optional<Error>;

// Value plus error return. The value is ignored when the status is set.
template <typename T> using Result = std::pair<T, Status>;

// Trailing parameter that collects every remaining param, decoded as T.
template <typename T> struct Variadic
{
    std::vector<T> values;

    auto begin() const noexcept { return values.begin(); }
    auto end() const noexcept { return values.end(); }
    std::size_t size() const noexcept { return values.size(); }
    bool empty() const noexcept { return values.empty(); }
    T const &operator[](std::size_t index) const { return values[index]; }
};

enum class CallStatus
{
    Resolved,
    Rejected,
    Unhandled,
};

// What a call produced: the result as JSON text when resolved, the error
// text when rejected.
struct CallOutcome
{
    CallStatus status = CallStatus::Unhandled;
    std::string payload;

    static CallOutcome resolved(std::string json)
    {
        return {CallStatus::Resolved, std::move(json)};
    }
    static CallOutcome rejected(std::string message)
    {
        return {CallStatus::Rejected, std::move(message)};
    }
    static CallOutcome unhandled() { return {}; }
};

using Params = std::vector<yyjson_val *>;
using Invoker = std::function<CallOutcome(Params const &)>;

struct Binding
{
    // Declared parameter count; a trailing Variadic counts as one.
    std::size_t arity = 0;
    bool variadic = false;
    Invoker invoke;

    bool accepts(std::size_t count) const noexcept
    {
        return variadic ? count + 1 >= arity : count == arity;
    }
};

// Serialises `root` into a resolved outcome, or a rejected one carrying the
// writer's error when the value is not representable (NaN, infinity).
CallOutcome finish_encoding(yyjson_mut_val *root);

namespace detail
{

template <typename T> struct is_variadic : std::false_type
{
};

template <typename T> struct is_variadic<Variadic<T>> : std::true_type
{
    using element = T;
};

template <typename T> struct is_result : std::false_type
{
};

template <typename T> struct is_result<std::pair<T, Status>> : std::true_type
{
};

template <typename T> using bare_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T> T decode_at(Params const &params, std::size_t index)
{
    try
    {
        return decode_value<T>(params[index]);
    }
    catch (DecodeError const &ex)
    {
        throw DecodeError(std::format("param {}: {}", index, ex.what()));
    }
}

template <typename Arg, std::size_t Index>
bare_t<Arg> decode_param(Params const &params)
{
    using T = bare_t<Arg>;
    if constexpr (is_variadic<T>::value)
    {
        using Element = typename is_variadic<T>::element;
        T pack;
        for (std::size_t i = Index; i < params.size(); ++i)
        {
            pack.values.push_back(decode_at<Element>(params, i));
        }
        return pack;
    }
    else
    {
        return decode_at<T>(params, Index);
    }
}

template <typename T> CallOutcome encode_outcome(T const &value)
{
    wv::json::MutableDocument doc;
    auto *root = encode_value<T>(doc.doc(), value);
    doc.set_root(root);
    return finish_encoding(root);
}

template <typename F, typename R, typename... Args, std::size_t... I>
CallOutcome invoke_with(F &fn, Params const &params,
                        std::index_sequence<I...>)
{
    // Every param is decoded before the callable runs.
    std::tuple<bare_t<Args>...> args{decode_param<Args, I>(params)...};
    using Ret = bare_t<R>;
    if constexpr (std::is_void_v<R>)
    {
        std::apply(fn, std::move(args));
        return CallOutcome::resolved("null");
    }
    else if constexpr (std::is_same_v<Ret, Status>)
    {
        Status status = std::apply(fn, std::move(args));
        if (status)
        {
            return CallOutcome::rejected(status->message);
        }
        return CallOutcome::resolved("null");
    }
    else if constexpr (is_result<Ret>::value)
    {
        Ret result = std::apply(fn, std::move(args));
        if (result.second)
        {
            return CallOutcome::rejected(result.second->message);
        }
        return encode_outcome(result.first);
    }
    else
    {
        Ret result = std::apply(fn, std::move(args));
        return encode_outcome(result);
    }
}

template <typename R, typename... Args> struct Signature
{
    static constexpr std::size_t arity = sizeof...(Args);
    static constexpr std::size_t variadic_count =
        (std::size_t{0} + ... +
         static_cast<std::size_t>(is_variadic<bare_t<Args>>::value));

    static constexpr bool last_is_variadic()
    {
        if constexpr (sizeof...(Args) == 0)
        {
            return false;
        }
        else
        {
            return is_variadic<bare_t<std::tuple_element_t<
                sizeof...(Args) - 1, std::tuple<Args...>>>>::value;
        }
    }

    static constexpr bool variadic = last_is_variadic();

    static_assert(variadic_count == (variadic ? 1 : 0),
                  "rpc::Variadic must be the last parameter");

    template <typename F> static CallOutcome call(F &fn, Params const &params)
    {
        return invoke_with<F, R, Args...>(fn, params,
                                          std::index_sequence_for<Args...>{});
    }
};

template <typename F>
struct FunctionTraits : FunctionTraits<decltype(&F::operator())>
{
};

template <typename R, typename... Args>
struct FunctionTraits<R (*)(Args...)> : Signature<R, Args...>
{
};

template <typename R, typename... Args>
struct FunctionTraits<R (*)(Args...) noexcept> : Signature<R, Args...>
{
};

template <typename R, typename... Args>
struct FunctionTraits<R(Args...)> : Signature<R, Args...>
{
};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...)> : Signature<R, Args...>
{
};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...) const> : Signature<R, Args...>
{
};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...) noexcept> : Signature<R, Args...>
{
};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...) const noexcept>
    : Signature<R, Args...>
{
};

} // namespace detail

// Builds a Binding for any callable whose parameter and return types have
// codecs. Decoders and the result encoder are fixed here, at bind time.
template <typename F> Binding make_binding(F fn)
{
    using Traits = detail::FunctionTraits<std::decay_t<F>>;
    Binding binding;
    binding.arity = Traits::arity;
    binding.variadic = Traits::variadic;
    binding.invoke = [fn = std::move(fn)](Params const &params) mutable
    { return Traits::call(fn, params); };
    return binding;
}

} // namespace wv::rpc
