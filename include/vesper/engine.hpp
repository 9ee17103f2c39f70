#pragma once

#include <vesper/dpi.hpp>
#include <vesper/http.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vesper
{

class RuntimeConfig;

enum class WindowLevel : uint32_t
{
    Normal         = 0,
    AlwaysOnTop    = 1,
    AlwaysOnBottom = 2,
};

// Everything the engine needs to open its window.
struct EngineSettings
{
    std::optional<std::string>     title;
    std::optional<LogicalPosition> position;
    std::optional<LogicalSize>     inner_size;
    bool                           decorated   = true;
    bool                           transparent = false;
    bool                           fullscreen  = false;
    bool                           maximized   = false;
    bool                           visible     = true;
    bool                           focused     = true;
    std::optional<Theme>           theme;
    std::optional<std::string>     resource_directory;
    std::optional<uint16_t>        devtools_port;
    std::vector<std::string>       user_scripts;
};

// Called with the response, or nullopt to let the engine serve the
// request itself.
using ResourceResponder      = std::function<void(std::optional<HttpResponse>)>;
using ResourceRequestHandler = std::function<void(HttpRequest request, ResourceResponder responder)>;

// Returns whether the navigation may proceed.
using NavigationHandler     = std::function<bool(const std::string& url)>;
using CloseRequestedHandler = std::function<void()>;

// Control surface of one running engine window.
//
// Implementations are thread-safe: any method may be called from any thread.
// Setters return false and getters return nullopt when the engine did not
// answer.  Callbacks run on an engine-owned thread, never the owning thread.
class EngineController
{
   public:
    virtual ~EngineController() = default;

    virtual bool navigate(const std::string& url)         = 0;
    virtual bool execute_script(const std::string& script) = 0;
    virtual bool reload()                                  = 0;

    virtual std::optional<std::string> current_url() = 0;
    virtual std::optional<std::string> title()       = 0;
    virtual bool                       set_title(const std::string& title) = 0;

    virtual std::optional<PhysicalSize<uint32_t>> inner_size() = 0;
    virtual bool                                  set_size(const Size& size) = 0;

    // (0, 0) when the platform cannot report window positions.
    virtual std::optional<PhysicalPosition<int32_t>> position() = 0;
    virtual bool set_position(const Position& position)          = 0;

    virtual std::optional<double> scale_factor() = 0;

    virtual std::optional<bool> is_fullscreen() = 0;
    virtual bool                set_fullscreen(bool fullscreen) = 0;
    virtual std::optional<bool> is_minimized() = 0;
    virtual bool                set_minimized(bool minimized) = 0;
    virtual std::optional<bool> is_maximized() = 0;
    virtual bool                set_maximized(bool maximized) = 0;
    virtual std::optional<bool> is_visible() = 0;
    virtual bool                set_visible(bool visible) = 0;

    virtual bool focus()                            = 0;
    virtual bool set_window_level(WindowLevel level) = 0;
    virtual bool start_dragging()                   = 0;

    // Closes the engine window and shuts the engine down.  Idempotent.
    virtual bool exit() = 0;

    // Callback registration.  A later registration replaces the earlier one.
    virtual bool on_close_requested(CloseRequestedHandler handler)       = 0;
    virtual bool on_resource_requested(ResourceRequestHandler handler)   = 0;
    virtual bool on_navigation_starting(NavigationHandler handler)       = 0;
};

// Starts an engine and returns its controller.
class EngineLauncher
{
   public:
    virtual ~EngineLauncher() = default;

    // Throws RuntimeError (EngineLaunch, ConfigMissing) when the engine
    // cannot be started.  Never returns null.
    virtual std::shared_ptr<EngineController> launch(const EngineSettings& settings,
                                                     const std::string&    url) = 0;
};

// Launcher that spawns the engine executable named by the config and talks
// to it over a Unix socket.
std::shared_ptr<EngineLauncher> make_process_engine_launcher(const RuntimeConfig& config);

}   // namespace vesper
