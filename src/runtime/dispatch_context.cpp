#include "dispatch_context.hpp"

#include "protocol/resource_bridge.hpp"
#include "protocol/uri_strategy.hpp"

#include <vesper/engine.hpp>
#include <vesper/logger.hpp>

#include <string>

namespace vesper
{

static void abandon_engine(EngineController& engine, const std::string& label)
{
    if (!engine.exit())
        VESPER_LOG_WARN("window", "Engine for window '{}' did not acknowledge exit", label);
}

DispatchContext::DispatchContext(RuntimeConfig                     config,
                                 CommandSender                     sender,
                                 std::shared_ptr<EventLoopContext> loop_context,
                                 std::shared_ptr<EngineLauncher>   launcher)
    : config_(std::move(config)),
      owning_thread_(loop_context->owner()),
      sender_(std::move(sender)),
      loop_context_(std::move(loop_context)),
      launcher_(std::move(launcher))
{
}

void DispatchContext::ensure_owning_thread(std::string_view what) const
{
    if (!is_owning_thread())
        throw RuntimeError(ErrorCode::WrongThread, std::string(what));
}

void DispatchContext::send(Message message)
{
    if (is_owning_thread())
    {
        if (auto* task = std::get_if<Task>(&message.payload()))
        {
            (*task)();
            return;
        }
        if (auto* task = std::get_if<TaskWithEventLoop>(&message.payload()))
        {
            (*task)(*loop_context_);
            return;
        }
    }

    const char* kind = message.kind_name();
    if (!sender_.send(std::move(message)))
    {
        VESPER_LOG_DEBUG("dispatch", "Dropping {} envelope: event loop has exited", kind);
        throw RuntimeError(ErrorCode::FailedToSendMessage, "event loop has exited");
    }
}

void DispatchContext::run_on_owning_thread(Task task)
{
    send(Message::task(std::move(task)));
}

DetachedWindow DispatchContext::create_window(PendingWindow pending)
{
    if (!pending.webview)
    {
        throw RuntimeError(ErrorCode::CreateWindow,
                           "window '" + pending.label
                               + "' has no webview; windows without one are not supported");
    }

    PendingWebview& webview = *pending.webview;
    if (!is_valid_url(webview.url))
    {
        throw RuntimeError(ErrorCode::CreateWindow,
                           "window '" + pending.label + "' has an invalid url '" + webview.url + "'");
    }

    const WindowId  window_id  = next_window_id();
    const WebviewId webview_id = next_webview_id();
    const bool      use_https  = webview.use_https_scheme.value_or(config_.use_https_scheme);

    EngineSettings settings = pending.window_builder.engine_settings();
    if (!settings.resource_directory)
        settings.resource_directory = config_.resource_directory();
    if (!settings.devtools_port)
        settings.devtools_port = config_.devtools_port();
    settings.user_scripts.insert(settings.user_scripts.end(),
                                 webview.initialization_scripts.begin(),
                                 webview.initialization_scripts.end());

    std::shared_ptr<EngineController> engine = launcher_->launch(settings, webview.url);
    if (!engine)
        throw RuntimeError(ErrorCode::EngineLaunch, "launcher returned no engine");

    auto bridge = std::make_shared<const ResourceBridge>(
        pending.label,
        std::shared_ptr<const UriStrategy>(make_uri_strategy(config_.protocol_strategy, use_https)),
        sender_,
        std::move(webview.uri_scheme_protocols));

    if (!engine->on_resource_requested(ResourceBridge::make_handler(bridge)))
    {
        abandon_engine(*engine, pending.label);
        throw RuntimeError(ErrorCode::CreateWindow,
                           "engine refused the resource handler for window '" + pending.label + "'");
    }

    if (webview.navigation_handler
        && !engine->on_navigation_starting(std::move(webview.navigation_handler)))
    {
        VESPER_LOG_ERROR("window",
                         "Failed to register the navigation handler for window '{}'",
                         pending.label);
    }

    CommandSender sender = sender_;
    if (!engine->on_close_requested(
            [sender, window_id]()
            {
                if (!sender.send(Message::close_window(window_id)))
                    VESPER_LOG_WARN("window",
                                    "Close request for window {} arrived after the event loop exited",
                                    window_id);
            }))
    {
        abandon_engine(*engine, pending.label);
        throw RuntimeError(ErrorCode::CreateWindow,
                           "engine refused the close handler for window '" + pending.label + "'");
    }

    auto listeners = std::make_shared<WindowEventListeners>();
    registry_.insert(window_id, WindowState{pending.label, engine, listeners});

    VESPER_LOG_INFO("window", "Created window {} ('{}') at {}", window_id, pending.label, webview.url);

    auto self = shared_from_this();
    return DetachedWindow{
        window_id,
        pending.label,
        WindowDispatcher(window_id, self, engine, std::move(listeners)),
        DetachedWebview{pending.label, WebviewDispatcher(webview_id, self, engine)},
        use_https,
    };
}

bool DispatchContext::handle_close_request(const RunCallback& callback, WindowId id, bool force)
{
    auto target = registry_.close_target(id);
    if (!target)
    {
        VESPER_LOG_DEBUG("window", "Close request for unknown window {}", id);
        return false;
    }

    if (!force)
    {
        // Subscribers share one signal, the host gets its own; a veto on
        // either prevents the close.
        CloseSignal subscriber_signal;
        WindowEvent event = CloseRequestedEvent{subscriber_signal};
        for (const auto& handler : target->listeners->snapshot())
            handler(event);

        CloseSignal host_signal;
        callback(RunWindowEvent{target->label, CloseRequestedEvent{host_signal}});

        if (subscriber_signal.prevented() || host_signal.prevented())
        {
            VESPER_LOG_DEBUG("window", "Close of window {} ('{}') was prevented", id, target->label);
            return false;
        }
    }

    std::shared_ptr<EngineController> engine;
    {
        auto removed = registry_.remove(id);
        if (!removed)
        {
            // Removed by a handler while the close was being decided.
            return false;
        }
        engine = std::move(removed->engine);
    }

    VESPER_LOG_INFO("window", "Destroyed window {} ('{}')", id, target->label);
    callback(RunWindowEvent{target->label, DestroyedEvent{}});

    // Subscribers commonly hold a dispatcher, and with it the engine.
    target->listeners->clear();

    // The engine is shut down here, on the owning thread, never by
    // whichever thread drops the last reference.
    if (!engine->exit())
        VESPER_LOG_ERROR("window", "Failed to shut down the engine of window {}", id);

    std::weak_ptr<EngineController> engine_ref = engine;
    engine.reset();
    if (!engine_ref.expired())
    {
        VESPER_LOG_WARN("window",
                        "Engine controller of window {} ('{}') is still referenced after close; "
                        "the engine is already shut down",
                        id,
                        target->label);
    }

    if (!registry_.empty())
        return false;

    ExitSignal exit_signal;
    callback(ExitRequestedEvent{std::nullopt, exit_signal});
    if (exit_signal.try_receive() == ExitRequestedAction::Prevent)
    {
        VESPER_LOG_DEBUG("runtime", "Exit after the last window closed was prevented");
        return false;
    }
    return true;
}

void DispatchContext::shutdown_windows()
{
    for (auto& [id, state] : registry_.take_all())
    {
        state.listeners->clear();
        VESPER_LOG_INFO("window", "Shutting down window {} ('{}')", id, state.label);
        if (!state.engine->exit())
            VESPER_LOG_ERROR("window", "Failed to shut down the engine of window {}", id);
    }
}

}   // namespace vesper
