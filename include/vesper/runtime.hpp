#pragma once

#include <vesper/config.hpp>
#include <vesper/dpi.hpp>
#include <vesper/events.hpp>
#include <vesper/fwd.hpp>
#include <vesper/window.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace vesper
{

class CommandChannel;
class EventLoop;

// Collaborators the runtime would otherwise build itself.
struct RuntimeOptions
{
    // Empty: spawn the engine executable named by RuntimeConfig.
    std::shared_ptr<EngineLauncher> engine_launcher;

    // Empty: GLFW.
    std::shared_ptr<MonitorProvider> monitor_provider;
};

// Posts user events into the event loop from any thread.
class EventLoopProxy
{
   public:
    explicit EventLoopProxy(std::shared_ptr<DispatchContext> context);

    // Throws RuntimeError(FailedToSendMessage) once the loop has exited.
    void send_event(UserEvent event) const;

   private:
    std::shared_ptr<DispatchContext> context_;
};

// Cloneable, thread-safe handle to a runtime.
class RuntimeHandle
{
   public:
    explicit RuntimeHandle(std::shared_ptr<DispatchContext> context);

    EventLoopProxy create_proxy() const;

    // Asks the loop to exit with `code`.  The host sees ExitRequested first
    // and may prevent it.
    void request_exit(int code) const;

    DetachedWindow create_window(PendingWindow pending) const;

    // Always throws RuntimeError(CreateWebview).
    DetachedWebview create_webview(WindowId window, PendingWebview pending) const;

    void run_on_main_thread(std::function<void()> task) const;

    std::optional<Monitor>   primary_monitor() const;
    std::optional<Monitor>   monitor_from_point(double x, double y) const;
    std::vector<Monitor>     available_monitors() const;
    PhysicalPosition<double> cursor_position() const;

    // Accepted, no effect.
    void set_theme(std::optional<Theme>) const {}

   private:
    std::shared_ptr<DispatchContext> context_;
};

// The runtime.  The thread that constructs it is the owning thread: the
// event loop runs there and every owning-thread-only call must be made
// from it.
class Runtime
{
   public:
    explicit Runtime(RuntimeConfig config = {}, RuntimeOptions options = {});
    ~Runtime();

    Runtime(const Runtime&)            = delete;
    Runtime& operator=(const Runtime&) = delete;

    EventLoopProxy create_proxy() const;
    RuntimeHandle  handle() const;

    DetachedWindow  create_window(PendingWindow pending);
    DetachedWebview create_webview(WindowId window, PendingWebview pending);

    // Owning thread only.
    std::optional<Monitor>   primary_monitor() const;
    std::optional<Monitor>   monitor_from_point(double x, double y) const;
    std::vector<Monitor>     available_monitors() const;
    PhysicalPosition<double> cursor_position() const;

    void set_theme(std::optional<Theme>) {}

    // Runs the loop until it exits and returns the exit code: the one passed
    // to request_exit, or 0 after the last window closed.
    int run(RunCallback callback);

    // One non-blocking pass over whatever is queued.  Returns false once the
    // loop has exited.
    bool run_iteration(const RunCallback& callback);

    const RuntimeConfig& config() const;
    size_t               window_count() const;
    bool                 has_window(WindowId id) const;

   private:
    std::shared_ptr<CommandChannel>  channel_;
    std::shared_ptr<DispatchContext> context_;
    std::unique_ptr<EventLoop>       loop_;
};

}   // namespace vesper
