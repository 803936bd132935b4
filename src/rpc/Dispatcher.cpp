#include "rpc/Dispatcher.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <string>
#include <utility>

namespace wv::rpc
{

Dispatcher::Dispatcher(ScriptSink eval, ScriptSink inject,
                       ResponsePoster post_response,
                       UnknownMethodPolicy policy)
    : eval_(std::move(eval)), inject_(std::move(inject)),
      post_response_(std::move(post_response)), policy_(policy)
{
}

void Dispatcher::bind_binding(std::string name, Binding binding)
{
    if (!binding.invoke)
    {
        WV_LOG_WARN("refusing to bind {} without a callable", name);
        return;
    }
    auto script = bootstrap_script(name);
    if (bindings_.bind(name, std::move(binding)))
    {
        WV_LOG_DEBUG("re-bound {}", name);
    }
    if (inject_)
    {
        inject_(std::move(script));
    }
}

void Dispatcher::dispatch(std::string_view payload)
{
    std::string error;
    auto request = parse_call(payload, error);
    if (!request)
    {
        WV_LOG_WARN("invalid RPC message: {}", error);
        return;
    }

    WV_LOG_DEBUG("Dispatching RPC id={} method={}", request->id,
                 request->method);
    auto outcome = call(*request);
    if (outcome.status == CallStatus::Unhandled)
    {
        WV_LOG_WARN("RPC method {} is not bound; call {} left pending",
                    request->method, request->id);
        return;
    }
    respond(request->id, outcome);
}

CallOutcome Dispatcher::call(CallRequest const &request) const
{
    auto binding = bindings_.find(request.method);
    if (!binding)
    {
        if (policy_.load(std::memory_order_relaxed) ==
            UnknownMethodPolicy::Reject)
        {
            return CallOutcome::rejected("unknown method: " + request.method);
        }
        return CallOutcome::unhandled();
    }
    if (!binding->accepts(request.params.size()))
    {
        return CallOutcome::rejected("function arguments mismatch");
    }
    try
    {
        return binding->invoke(request.params);
    }
    catch (DecodeError const &ex)
    {
        return CallOutcome::rejected(ex.what());
    }
    catch (std::exception const &ex)
    {
        WV_LOG_INFO("RPC binding {} threw: {}", request.method, ex.what());
        return CallOutcome::rejected(ex.what());
    }
}

BindingTable const &Dispatcher::bindings() const noexcept
{
    return bindings_;
}

UnknownMethodPolicy Dispatcher::unknown_method_policy() const noexcept
{
    return policy_.load(std::memory_order_relaxed);
}

void Dispatcher::set_unknown_method_policy(UnknownMethodPolicy policy) noexcept
{
    policy_.store(policy, std::memory_order_relaxed);
}

void Dispatcher::respond(std::int64_t id, CallOutcome const &outcome)
{
    auto script = outcome.status == CallStatus::Resolved
                      ? resolve_script(id, outcome.payload)
                      : reject_script(id, outcome.payload);
    if (!eval_)
    {
        return;
    }
    if (!post_response_)
    {
        eval_(std::move(script));
        return;
    }
    post_response_([eval = eval_, script = std::move(script)]() mutable
                   { eval(std::move(script)); });
}

} // namespace wv::rpc
