#pragma once

#include <vesper/dpi.hpp>

#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace vesper
{

class MonitorProvider;

// Owning-thread view of the event loop, handed to closures queued with
// DispatchContext::run_on_owning_thread_blocking.  Every call made from any
// other thread throws RuntimeError(WrongThread).
class EventLoopContext
{
   public:
    EventLoopContext(std::thread::id owner, std::shared_ptr<MonitorProvider> monitors);

    std::optional<Monitor> primary_monitor() const;
    std::vector<Monitor>   available_monitors() const;
    std::optional<Monitor> monitor_from_point(double x, double y) const;

    // Throws RuntimeError(FailedToGetCursorPosition) when unavailable.
    PhysicalPosition<double> cursor_position() const;

    bool            is_owning_thread() const { return std::this_thread::get_id() == owner_; }
    std::thread::id owner() const { return owner_; }

   private:
    void ensure_owning_thread(const char* what) const;

    std::thread::id                  owner_;
    std::shared_ptr<MonitorProvider> monitors_;
};

}   // namespace vesper
