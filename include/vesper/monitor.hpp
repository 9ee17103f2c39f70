#pragma once

#include <vesper/dpi.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace vesper
{

// Source of display information.  Only ever called on the owning thread.
class MonitorProvider
{
   public:
    virtual ~MonitorProvider() = default;

    virtual std::optional<Monitor> primary_monitor()    = 0;
    virtual std::vector<Monitor>   available_monitors() = 0;

    // Monitor whose bounds contain the physical point (x, y).
    virtual std::optional<Monitor> monitor_from_point(double x, double y);

    // nullopt when the cursor position cannot be determined.
    virtual std::optional<PhysicalPosition<double>> cursor_position() = 0;
};

// GLFW-backed provider.  GLFW is initialized lazily on first use; when it
// cannot initialize (no display) every query reports no monitors.
std::shared_ptr<MonitorProvider> make_glfw_monitor_provider();

}   // namespace vesper
