#include <vesper/engine.hpp>
#include <vesper/logger.hpp>
#include <vesper/monitor.hpp>
#include <vesper/runtime.hpp>

#include "command_channel.hpp"
#include "dispatch_context.hpp"
#include "event_loop.hpp"

#include <thread>

namespace vesper
{

// ─── EventLoopProxy ─────────────────────────────────────────────────────────

EventLoopProxy::EventLoopProxy(std::shared_ptr<DispatchContext> context)
    : context_(std::move(context))
{
}

void EventLoopProxy::send_event(UserEvent event) const
{
    context_->send(Message::user_event(std::move(event)));
}

// ─── RuntimeHandle ──────────────────────────────────────────────────────────

RuntimeHandle::RuntimeHandle(std::shared_ptr<DispatchContext> context)
    : context_(std::move(context))
{
}

EventLoopProxy RuntimeHandle::create_proxy() const
{
    return EventLoopProxy(context_);
}

void RuntimeHandle::request_exit(int code) const
{
    context_->send(Message::request_exit(code));
}

DetachedWindow RuntimeHandle::create_window(PendingWindow pending) const
{
    return context_->create_window(std::move(pending));
}

DetachedWebview RuntimeHandle::create_webview(WindowId, PendingWebview) const
{
    throw RuntimeError(ErrorCode::CreateWebview);
}

void RuntimeHandle::run_on_main_thread(std::function<void()> task) const
{
    context_->run_on_owning_thread(std::move(task));
}

std::optional<Monitor> RuntimeHandle::primary_monitor() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.primary_monitor(); });
}

std::optional<Monitor> RuntimeHandle::monitor_from_point(double x, double y) const
{
    return context_->run_on_owning_thread_blocking(
        [x, y](EventLoopContext& loop) { return loop.monitor_from_point(x, y); });
}

std::vector<Monitor> RuntimeHandle::available_monitors() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.available_monitors(); });
}

PhysicalPosition<double> RuntimeHandle::cursor_position() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.cursor_position(); });
}

// ─── Runtime ────────────────────────────────────────────────────────────────

Runtime::Runtime(RuntimeConfig config, RuntimeOptions options)
    : channel_(std::make_shared<CommandChannel>())
{
    if (!options.monitor_provider)
        options.monitor_provider = make_glfw_monitor_provider();
    if (!options.engine_launcher)
        options.engine_launcher = make_process_engine_launcher(config);

    auto loop_context = std::make_shared<EventLoopContext>(std::this_thread::get_id(),
                                                           std::move(options.monitor_provider));
    context_ = std::make_shared<DispatchContext>(std::move(config),
                                                 CommandSender(channel_),
                                                 loop_context,
                                                 std::move(options.engine_launcher));
    loop_ = std::make_unique<EventLoop>(channel_, context_, std::move(loop_context));

    VESPER_LOG_DEBUG("runtime", "Runtime created");
}

Runtime::~Runtime()
{
    loop_->abandon();
}

EventLoopProxy Runtime::create_proxy() const
{
    return EventLoopProxy(context_);
}

RuntimeHandle Runtime::handle() const
{
    return RuntimeHandle(context_);
}

DetachedWindow Runtime::create_window(PendingWindow pending)
{
    return context_->create_window(std::move(pending));
}

DetachedWebview Runtime::create_webview(WindowId, PendingWebview)
{
    throw RuntimeError(ErrorCode::CreateWebview);
}

std::optional<Monitor> Runtime::primary_monitor() const
{
    context_->ensure_owning_thread("Runtime::primary_monitor");
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.primary_monitor(); });
}

std::optional<Monitor> Runtime::monitor_from_point(double x, double y) const
{
    context_->ensure_owning_thread("Runtime::monitor_from_point");
    return context_->run_on_owning_thread_blocking(
        [x, y](EventLoopContext& loop) { return loop.monitor_from_point(x, y); });
}

std::vector<Monitor> Runtime::available_monitors() const
{
    context_->ensure_owning_thread("Runtime::available_monitors");
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.available_monitors(); });
}

PhysicalPosition<double> Runtime::cursor_position() const
{
    context_->ensure_owning_thread("Runtime::cursor_position");
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.cursor_position(); });
}

int Runtime::run(RunCallback callback)
{
    return loop_->run(callback);
}

bool Runtime::run_iteration(const RunCallback& callback)
{
    return loop_->run_iteration(callback);
}

const RuntimeConfig& Runtime::config() const
{
    return context_->config();
}

size_t Runtime::window_count() const
{
    return context_->registry().size();
}

bool Runtime::has_window(WindowId id) const
{
    return context_->registry().contains(id);
}

}   // namespace vesper
