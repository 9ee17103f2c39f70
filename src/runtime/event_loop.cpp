#include "event_loop.hpp"

#include <vesper/logger.hpp>

#include <type_traits>

namespace vesper
{

EventLoop::EventLoop(std::shared_ptr<CommandChannel>   channel,
                     std::shared_ptr<DispatchContext>  context,
                     std::shared_ptr<EventLoopContext> loop_context)
    : channel_(std::move(channel)),
      context_(std::move(context)),
      loop_context_(std::move(loop_context))
{
}

int EventLoop::run(const RunCallback& callback)
{
    context_->ensure_owning_thread("Runtime::run");
    if (exited_)
        return exit_code_;

    start(callback);

    bool should_exit = false;
    while (!should_exit)
    {
        std::deque<Message> batch;
        if (!channel_->wait_and_take(batch))
            break;
        should_exit = process(batch, callback);
    }

    finish(callback);
    return exit_code_;
}

bool EventLoop::run_iteration(const RunCallback& callback)
{
    context_->ensure_owning_thread("Runtime::run_iteration");
    if (exited_)
        return false;

    start(callback);

    std::deque<Message> batch;
    channel_->take_all(batch);
    if (process(batch, callback))
    {
        finish(callback);
        return false;
    }
    return true;
}

void EventLoop::abandon()
{
    if (exited_)
        return;
    exited_ = true;
    channel_->close();
    context_->shutdown_windows();
}

void EventLoop::start(const RunCallback& callback)
{
    if (started_)
        return;
    started_ = true;
    VESPER_LOG_DEBUG("runtime", "Event loop started");
    callback(ReadyEvent{});
}

bool EventLoop::process(std::deque<Message>& batch, const RunCallback& callback)
{
    callback(ResumedEvent{});

    bool should_exit = false;
    while (!batch.empty() && !should_exit)
    {
        Message message = std::move(batch.front());
        batch.pop_front();
        should_exit = handle(message, callback);
    }

    callback(MainEventsClearedEvent{});
    return should_exit;
}

bool EventLoop::handle(Message& message, const RunCallback& callback)
{
    return std::visit(
        [&](auto& payload) -> bool
        {
            using T = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<T, Task>)
            {
                payload();
                return false;
            }
            else if constexpr (std::is_same_v<T, TaskWithEventLoop>)
            {
                payload(*loop_context_);
                return false;
            }
            else if constexpr (std::is_same_v<T, Message::CloseWindow>)
            {
                return context_->handle_close_request(callback, payload.id, false);
            }
            else if constexpr (std::is_same_v<T, Message::DestroyWindow>)
            {
                return context_->handle_close_request(callback, payload.id, true);
            }
            else if constexpr (std::is_same_v<T, Message::RequestExit>)
            {
                ExitSignal signal;
                callback(ExitRequestedEvent{payload.code, signal});
                if (signal.try_receive() == ExitRequestedAction::Prevent)
                {
                    VESPER_LOG_DEBUG("runtime", "Exit with code {} was prevented", payload.code);
                    return false;
                }
                exit_code_ = payload.code;
                return true;
            }
            else
            {
                callback(RunUserEvent{std::move(payload.event)});
                return false;
            }
        },
        message.payload());
}

void EventLoop::finish(const RunCallback& callback)
{
    exited_ = true;

    // Whatever is still queued is dropped; blocked callers get
    // FailedToReceiveMessage.
    channel_->close();
    context_->shutdown_windows();

    VESPER_LOG_INFO("runtime", "Event loop exited with code {}", exit_code_);
    callback(ExitEvent{});
}

}   // namespace vesper
