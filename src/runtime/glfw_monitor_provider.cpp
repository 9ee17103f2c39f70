#include <vesper/logger.hpp>
#include <vesper/monitor.hpp>

#include <GLFW/glfw3.h>

namespace vesper
{

namespace
{

void glfw_error_callback(int error, const char* description)
{
    VESPER_LOG_DEBUG("monitor", "GLFW error {}: {}", error, description);
}

// Display information through GLFW.  GLFW may only be used from the main
// thread, which for a runtime is the owning thread.
class GlfwMonitorProvider final : public MonitorProvider
{
   public:
    GlfwMonitorProvider() = default;

    ~GlfwMonitorProvider() override
    {
        if (initialized_)
            glfwTerminate();
    }

    GlfwMonitorProvider(const GlfwMonitorProvider&)            = delete;
    GlfwMonitorProvider& operator=(const GlfwMonitorProvider&) = delete;

    std::optional<Monitor> primary_monitor() override
    {
        if (!ensure_initialized())
            return std::nullopt;
        GLFWmonitor* monitor = glfwGetPrimaryMonitor();
        if (!monitor)
            return std::nullopt;
        return to_monitor(monitor);
    }

    std::vector<Monitor> available_monitors() override
    {
        std::vector<Monitor> out;
        if (!ensure_initialized())
            return out;

        int           count    = 0;
        GLFWmonitor** monitors = glfwGetMonitors(&count);
        for (int i = 0; i < count; ++i)
            out.push_back(to_monitor(monitors[i]));
        return out;
    }

    // GLFW only knows the cursor relative to a window of its own, and the
    // engine owns every window.
    std::optional<PhysicalPosition<double>> cursor_position() override { return std::nullopt; }

   private:
    bool ensure_initialized()
    {
        if (attempted_)
            return initialized_;
        attempted_ = true;

        glfwSetErrorCallback(glfw_error_callback);
        initialized_ = glfwInit() == GLFW_TRUE;
        if (!initialized_)
            VESPER_LOG_WARN("monitor", "GLFW could not initialize; no monitors will be reported");
        return initialized_;
    }

    static Monitor to_monitor(GLFWmonitor* handle)
    {
        Monitor monitor;

        const char* name = glfwGetMonitorName(handle);
        monitor.name     = name ? name : "";

        int x = 0, y = 0;
        glfwGetMonitorPos(handle, &x, &y);
        monitor.position = {x, y};

        if (const GLFWvidmode* mode = glfwGetVideoMode(handle))
            monitor.size = {static_cast<uint32_t>(mode->width), static_cast<uint32_t>(mode->height)};

        float sx = 1.0f, sy = 1.0f;
        glfwGetMonitorContentScale(handle, &sx, &sy);
        monitor.scale_factor = static_cast<double>(sx);

        int wx = 0, wy = 0, ww = 0, wh = 0;
        glfwGetMonitorWorkarea(handle, &wx, &wy, &ww, &wh);
        monitor.work_area = {{wx, wy}, {static_cast<uint32_t>(ww), static_cast<uint32_t>(wh)}};

        return monitor;
    }

    bool attempted_   = false;
    bool initialized_ = false;
};

}   // namespace

std::shared_ptr<MonitorProvider> make_glfw_monitor_provider()
{
    return std::make_shared<GlfwMonitorProvider>();
}

}   // namespace vesper
