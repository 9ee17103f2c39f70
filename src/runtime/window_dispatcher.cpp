#include <vesper/engine.hpp>
#include <vesper/error.hpp>
#include <vesper/window.hpp>

#include "dispatch_context.hpp"
#include "window_registry.hpp"

namespace vesper
{

namespace
{

template <typename T>
T expect(std::optional<T> value, const char* what)
{
    if (!value)
        throw RuntimeError(ErrorCode::FailedToSendMessage, what);
    return std::move(*value);
}

void expect(bool ok, const char* what)
{
    if (!ok)
        throw RuntimeError(ErrorCode::FailedToSendMessage, what);
}

}   // namespace

WindowDispatcher::WindowDispatcher(WindowId                              id,
                                   std::shared_ptr<DispatchContext>      context,
                                   std::shared_ptr<EngineController>     engine,
                                   std::shared_ptr<WindowEventListeners> listeners)
    : id_(id),
      context_(std::move(context)),
      engine_(std::move(engine)),
      listeners_(std::move(listeners))
{
}

void WindowDispatcher::run_on_main_thread(std::function<void()> task) const
{
    context_->run_on_owning_thread(std::move(task));
}

WindowEventId WindowDispatcher::on_window_event(WindowEventHandler handler) const
{
    WindowEventId id = context_->next_window_event_id();
    listeners_->add(id, std::move(handler));
    return id;
}

// ─── Getters ────────────────────────────────────────────────────────────────

double WindowDispatcher::scale_factor() const
{
    return expect(engine_->scale_factor(), "scale_factor");
}

PhysicalPosition<int32_t> WindowDispatcher::inner_position() const
{
    return expect(engine_->position(), "inner_position");
}

PhysicalPosition<int32_t> WindowDispatcher::outer_position() const
{
    return expect(engine_->position(), "outer_position");
}

PhysicalSize<uint32_t> WindowDispatcher::inner_size() const
{
    return expect(engine_->inner_size(), "inner_size");
}

PhysicalSize<uint32_t> WindowDispatcher::outer_size() const
{
    return expect(engine_->inner_size(), "outer_size");
}

bool WindowDispatcher::is_fullscreen() const
{
    return expect(engine_->is_fullscreen(), "is_fullscreen");
}

bool WindowDispatcher::is_minimized() const
{
    return expect(engine_->is_minimized(), "is_minimized");
}

bool WindowDispatcher::is_maximized() const
{
    return expect(engine_->is_maximized(), "is_maximized");
}

bool WindowDispatcher::is_visible() const
{
    return expect(engine_->is_visible(), "is_visible");
}

std::string WindowDispatcher::title() const
{
    return expect(engine_->title(), "title");
}

std::optional<Monitor> WindowDispatcher::primary_monitor() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.primary_monitor(); });
}

std::optional<Monitor> WindowDispatcher::monitor_from_point(double x, double y) const
{
    return context_->run_on_owning_thread_blocking(
        [x, y](EventLoopContext& loop) { return loop.monitor_from_point(x, y); });
}

std::vector<Monitor> WindowDispatcher::available_monitors() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.available_monitors(); });
}

PhysicalPosition<double> WindowDispatcher::cursor_position() const
{
    return context_->run_on_owning_thread_blocking(
        [](EventLoopContext& loop) { return loop.cursor_position(); });
}

// ─── Setters ────────────────────────────────────────────────────────────────

void WindowDispatcher::set_title(const std::string& title) const
{
    expect(engine_->set_title(title), "set_title");
}

void WindowDispatcher::maximize() const
{
    expect(engine_->set_maximized(true), "maximize");
}

void WindowDispatcher::unmaximize() const
{
    expect(engine_->set_maximized(false), "unmaximize");
}

void WindowDispatcher::minimize() const
{
    expect(engine_->set_minimized(true), "minimize");
}

void WindowDispatcher::unminimize() const
{
    expect(engine_->set_minimized(false), "unminimize");
}

void WindowDispatcher::show() const
{
    expect(engine_->set_visible(true), "show");
}

void WindowDispatcher::hide() const
{
    expect(engine_->set_visible(false), "hide");
}

void WindowDispatcher::set_size(const Size& size) const
{
    expect(engine_->set_size(size), "set_size");
}

void WindowDispatcher::set_position(const Position& position) const
{
    expect(engine_->set_position(position), "set_position");
}

void WindowDispatcher::set_fullscreen(bool fullscreen) const
{
    expect(engine_->set_fullscreen(fullscreen), "set_fullscreen");
}

void WindowDispatcher::set_focus() const
{
    expect(engine_->focus(), "set_focus");
}

void WindowDispatcher::set_always_on_top(bool always_on_top) const
{
    expect(engine_->set_window_level(always_on_top ? WindowLevel::AlwaysOnTop : WindowLevel::Normal),
           "set_always_on_top");
}

void WindowDispatcher::start_dragging() const
{
    expect(engine_->start_dragging(), "start_dragging");
}

void WindowDispatcher::close() const
{
    context_->send(Message::close_window(id_));
}

void WindowDispatcher::destroy() const
{
    context_->send(Message::destroy_window(id_));
}

DetachedWindow WindowDispatcher::create_window(PendingWindow pending) const
{
    return context_->create_window(std::move(pending));
}

DetachedWebview WindowDispatcher::create_webview(PendingWebview) const
{
    throw RuntimeError(ErrorCode::CreateWebview);
}

}   // namespace vesper
