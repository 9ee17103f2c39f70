#include <vesper/error.hpp>
#include <vesper/event_loop_context.hpp>
#include <vesper/monitor.hpp>

namespace vesper
{

EventLoopContext::EventLoopContext(std::thread::id owner, std::shared_ptr<MonitorProvider> monitors)
    : owner_(owner), monitors_(std::move(monitors))
{
}

void EventLoopContext::ensure_owning_thread(const char* what) const
{
    if (!is_owning_thread())
        throw RuntimeError(ErrorCode::WrongThread, what);
}

std::optional<Monitor> EventLoopContext::primary_monitor() const
{
    ensure_owning_thread("primary_monitor");
    return monitors_->primary_monitor();
}

std::vector<Monitor> EventLoopContext::available_monitors() const
{
    ensure_owning_thread("available_monitors");
    return monitors_->available_monitors();
}

std::optional<Monitor> EventLoopContext::monitor_from_point(double x, double y) const
{
    ensure_owning_thread("monitor_from_point");
    return monitors_->monitor_from_point(x, y);
}

PhysicalPosition<double> EventLoopContext::cursor_position() const
{
    ensure_owning_thread("cursor_position");
    auto position = monitors_->cursor_position();
    if (!position)
        throw RuntimeError(ErrorCode::FailedToGetCursorPosition);
    return *position;
}

std::optional<Monitor> MonitorProvider::monitor_from_point(double x, double y)
{
    for (auto& monitor : available_monitors())
    {
        PhysicalRect bounds{monitor.position, monitor.size};
        if (bounds.contains(x, y))
            return std::move(monitor);
    }
    return std::nullopt;
}

}   // namespace vesper
