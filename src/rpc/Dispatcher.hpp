#pragma once

#include "rpc/Binding.hpp"
#include "rpc/BindingTable.hpp"
#include "rpc/Message.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace wv::rpc
{

// What to do with a call naming a method nobody bound.
enum class UnknownMethodPolicy
{
    // Drop it; the page-side promise stays pending.
    Ignore,
    // Reject the promise with "unknown method: <name>".
    Reject,
};

using ScriptSink = std::function<void(std::string)>;
using ResponsePoster = std::function<void(std::function<void()>)>;

// Routes inbound page messages to bound callables and answers with
// resolve/reject scripts. Scripts go through `post_response` so they run on
// the window's thread; `inject` receives the per-binding bootstrap script.
class Dispatcher
{
  public:
    Dispatcher(ScriptSink eval, ScriptSink inject,
               ResponsePoster post_response = {},
               UnknownMethodPolicy policy = UnknownMethodPolicy::Ignore);

    template <typename F> void bind(std::string name, F fn)
    {
        bind_binding(std::move(name), make_binding(std::move(fn)));
    }

    void bind_binding(std::string name, Binding binding);

    // Handles one raw message from the page.
    void dispatch(std::string_view payload);

    // Resolves and runs the binding for `request` without responding.
    CallOutcome call(CallRequest const &request) const;

    BindingTable const &bindings() const noexcept;
    UnknownMethodPolicy unknown_method_policy() const noexcept;
    void set_unknown_method_policy(UnknownMethodPolicy policy) noexcept;

  private:
    void respond(std::int64_t id, CallOutcome const &outcome);

    ScriptSink eval_;
    ScriptSink inject_;
    ResponsePoster post_response_;
    std::atomic<UnknownMethodPolicy> policy_;
    BindingTable bindings_;
};

} // namespace wv::rpc
