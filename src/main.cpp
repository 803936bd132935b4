#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <Windows.h>

#include <cctype>
#include <format>
#include <string>
#include <string_view>
#include <thread>

#include "utils/Log.hpp"
#include "utils/Version.hpp"
#include "webview/SingleInstance.hpp"
#include "webview/WebView.hpp"

namespace
{

constexpr char kPage[] = R"(<!doctype html>
<html>
<body style="font-family: sans-serif">
<h3>wvbridge demo</h3>
<button onclick="add(2, 3).then(r => out.textContent = 'add: ' + r)">add</button>
<button onclick="greet('web').then(r => out.textContent = r)">greet</button>
<button onclick="sum(1, 2.5, 4).then(r => out.textContent = 'sum: ' + r)">sum</button>
<button onclick="fail().catch(e => out.textContent = 'rejected: ' + e)">fail</button>
<button onclick="later().then(r => out.textContent = r)">later</button>
<button onclick="quit()">quit</button>
<pre id="out"></pre>
</body>
</html>)";

std::string data_url(std::string_view html)
{
    std::string url = "data:text/html,";
    for (unsigned char c : html)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            url.push_back(static_cast<char>(c));
        }
        else
        {
            url += std::format("%{:02X}", static_cast<unsigned>(c));
        }
    }
    return url;
}

} // namespace

int WINAPI wWinMain(HINSTANCE, HINSTANCE, PWSTR, int)
{
    wv::webview::SingleInstanceLock lock("wvbridge-demo");
    if (!lock.acquired())
    {
        return 0;
    }

    wv::app::WebViewOptions options;
    options.debug = true;
    options.auto_focus = true;
    options.window.title =
        std::string("wvbridge demo ") + wv::version::kSemanticVersion;
    options.window.width = 800;
    options.window.height = 600;
    options.window.center = true;

    auto view = wv::webview::create_webview(options);
    if (!view)
    {
        WV_LOG_ERROR("failed to create the demo window");
        return 1;
    }
    view->set_size(480, 320, wv::app::Hint::Min);

    view->bind("add", [](int a, int b) { return a + b; });
    view->bind("greet",
               [](std::string const &name)
               { return std::format("hello, {}", name); });
    view->bind("sum",
               [](wv::rpc::Variadic<double> const &values)
               {
                   double total = 0;
                   for (double value : values)
                   {
                       total += value;
                   }
                   return total;
               });
    view->bind("fail", []() -> wv::rpc::Status
               { return wv::rpc::Error{"this call always fails"}; });

    auto *raw = view.get();
    // Resolves from a worker thread through the dispatch queue.
    view->bind("later",
               [raw]()
               {
                   std::thread(
                       [raw]
                       {
                           raw->dispatch([raw]
                                         { raw->set_title("worker finished"); });
                       })
                       .detach();
                   return std::string("started worker");
               });
    view->bind("quit", [raw]() { raw->dispatch([raw] { raw->terminate(); }); });

    view->navigate(data_url(kPage));
    view->run();
    view->destroy();
    return 0;
}
#endif
