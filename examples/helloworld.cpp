// Opens one window that loads its page from a custom "app" protocol.
//
//   VESPER_ENGINE_PATH=/path/to/versoview ./helloworld

#include <vesper/vesper.hpp>

#include <iostream>

using namespace vesper;

static constexpr const char* INDEX_HTML = R"(<!doctype html>
<html>
  <head><title>Hello from vesper</title></head>
  <body>
    <h1>Hello, world!</h1>
    <p>Served by the host through the app:// protocol.</p>
  </body>
</html>
)";

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    RuntimeConfig config = RuntimeConfig::from_environment();
    if (!config.engine_path())
    {
        std::cerr << "Set VESPER_ENGINE_PATH to the engine executable\n";
        return 1;
    }

    try
    {
        Runtime runtime(std::move(config));

        PendingWebview webview;
        webview.url = "app://localhost/index.html";
        webview.register_uri_scheme_protocol(
            "app",
            [](const std::string& label, HttpRequest request, UriSchemeResponder respond)
            {
                VESPER_LOG_INFO("helloworld", "[{}] {} {}", label, request.method, request.uri);

                HttpResponse response;
                response.headers.append("Content-Type", "text/html; charset=utf-8");
                std::string body(INDEX_HTML);
                response.body.assign(body.begin(), body.end());
                respond(std::move(response));
            });

        PendingWindow window;
        window.label          = "main";
        window.window_builder = WindowBuilder().title("Hello").inner_size(800, 600);
        window.webview        = std::move(webview);
        runtime.create_window(std::move(window));

        return runtime.run(
            [](const RunEvent& event)
            {
                if (std::holds_alternative<ReadyEvent>(event))
                    VESPER_LOG_INFO("helloworld", "Event loop ready");
                else if (auto* w = std::get_if<RunWindowEvent>(&event))
                {
                    if (std::holds_alternative<DestroyedEvent>(w->event))
                        VESPER_LOG_INFO("helloworld", "Window '{}' destroyed", w->label);
                }
                else if (std::holds_alternative<ExitEvent>(event))
                    VESPER_LOG_INFO("helloworld", "Bye");
            });
    }
    catch (const RuntimeError& e)
    {
        VESPER_LOG_CRITICAL("helloworld", "{}", e.what());
        return 1;
    }
}
