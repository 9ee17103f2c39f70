#pragma once

#include "command_channel.hpp"
#include "message.hpp"
#include "window_registry.hpp"

#include <vesper/config.hpp>
#include <vesper/error.hpp>
#include <vesper/event_loop_context.hpp>
#include <vesper/events.hpp>
#include <vesper/fwd.hpp>
#include <vesper/window.hpp>

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace vesper
{

// State shared by the runtime and every handle it gives out: the sending
// side of the command channel, the window registry, the id counters and the
// owning-thread token.
class DispatchContext : public std::enable_shared_from_this<DispatchContext>
{
   public:
    DispatchContext(RuntimeConfig                     config,
                    CommandSender                     sender,
                    std::shared_ptr<EventLoopContext> loop_context,
                    std::shared_ptr<EngineLauncher>   launcher);

    DispatchContext(const DispatchContext&)            = delete;
    DispatchContext& operator=(const DispatchContext&) = delete;

    // ── Threading ──

    bool is_owning_thread() const { return std::this_thread::get_id() == owning_thread_; }

    // Throws RuntimeError(WrongThread) off the owning thread.
    void ensure_owning_thread(std::string_view what) const;

    // Tasks run inline on the owning thread; anything else is queued.
    // Throws RuntimeError(FailedToSendMessage) when the loop has exited.
    void send(Message message);

    // Inline on the owning thread, queued (fire-and-forget) elsewhere.
    void run_on_owning_thread(Task task);

    // Runs `fn(EventLoopContext&)` on the owning thread and returns its
    // result.  Inline there; from any other thread the caller blocks until
    // the loop has run it.  Exceptions thrown by `fn` reach the caller.
    // Throws RuntimeError(FailedToReceiveMessage) if the loop exits first.
    template <typename F>
    std::invoke_result_t<F&, EventLoopContext&> run_on_owning_thread_blocking(F fn);

    // ── Identifiers ──

    WindowId       next_window_id() { return next_window_id_.fetch_add(1); }
    WebviewId      next_webview_id() { return next_webview_id_.fetch_add(1); }
    WindowEventId  next_window_event_id() { return next_window_event_id_.fetch_add(1); }
    WebviewEventId next_webview_event_id() { return next_webview_event_id_.fetch_add(1); }

    // ── Windows ──

    // Launches an engine for `pending` and registers the window.
    DetachedWindow create_window(PendingWindow pending);

    // Close protocol for window `id`.  Unless `force`, subscribers and the
    // host callback may veto.  Returns whether the event loop should exit.
    // Owning thread only.
    bool handle_close_request(const RunCallback& callback, WindowId id, bool force);

    // Removes every window and shuts its engine down.  Used once the loop
    // has exited.
    void shutdown_windows();

    const WindowRegistry& registry() const { return registry_; }
    const RuntimeConfig&  config() const { return config_; }
    const CommandSender&  sender() const { return sender_; }

   private:
    const RuntimeConfig               config_;
    const std::thread::id             owning_thread_;
    CommandSender                     sender_;
    std::shared_ptr<EventLoopContext> loop_context_;
    std::shared_ptr<EngineLauncher>   launcher_;
    WindowRegistry                    registry_;

    std::atomic<WindowId>       next_window_id_{1};
    std::atomic<WebviewId>      next_webview_id_{1};
    std::atomic<WindowEventId>  next_window_event_id_{1};
    std::atomic<WebviewEventId> next_webview_event_id_{1};
};

template <typename F>
std::invoke_result_t<F&, EventLoopContext&> DispatchContext::run_on_owning_thread_blocking(F fn)
{
    using Result = std::invoke_result_t<F&, EventLoopContext&>;

    if (is_owning_thread())
        return fn(*loop_context_);

    // Only the envelope owns the promise, so dropping it unexecuted breaks
    // the promise and wakes the caller.
    auto promise = std::make_shared<std::promise<Result>>();
    auto future  = promise->get_future();

    send(Message::task_with_event_loop(
        [promise = std::move(promise), fn = std::move(fn)](EventLoopContext& context) mutable
        {
            try
            {
                if constexpr (std::is_void_v<Result>)
                {
                    fn(context);
                    promise->set_value();
                }
                else
                {
                    promise->set_value(fn(context));
                }
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        }));

    try
    {
        return future.get();
    }
    catch (const std::future_error&)
    {
        // The envelope was dropped unexecuted: broken promise.
        throw RuntimeError(ErrorCode::FailedToReceiveMessage);
    }
}

}   // namespace vesper
