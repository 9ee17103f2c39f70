#pragma once

#include <vesper/dpi.hpp>
#include <vesper/events.hpp>
#include <vesper/fwd.hpp>
#include <vesper/webview.hpp>
#include <vesper/window_builder.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vesper
{

struct WindowEventListeners;

// A window-creation request.  Only requests carrying a webview are
// accepted; the engine always renders one webview per window.
struct PendingWindow
{
    std::string                   label;
    WindowBuilder                 window_builder;
    std::optional<PendingWebview> webview;
};

enum class UserAttentionType
{
    Critical,
    Informational,
};

enum class CursorIcon
{
    Default,
    Pointer,
    Text,
};

// Cloneable handle for one window.  Safe to use from any thread.
//
// Getters and setters go straight to the engine and throw
// RuntimeError(FailedToSendMessage) when it does not answer.  Attributes the
// engine has no notion of report a fixed value, and their setters do
// nothing.
class WindowDispatcher
{
   public:
    WindowDispatcher(WindowId                              id,
                     std::shared_ptr<DispatchContext>      context,
                     std::shared_ptr<EngineController>     engine,
                     std::shared_ptr<WindowEventListeners> listeners);

    WindowId id() const { return id_; }

    void run_on_main_thread(std::function<void()> task) const;

    // Handlers see CloseRequested before the host callback does and may veto
    // it.  Handlers are dropped once the window is destroyed.
    WindowEventId on_window_event(WindowEventHandler handler) const;

    // ── Getters ──
    double                    scale_factor() const;
    PhysicalPosition<int32_t> inner_position() const;
    PhysicalPosition<int32_t> outer_position() const;
    PhysicalSize<uint32_t>    inner_size() const;
    PhysicalSize<uint32_t>    outer_size() const;
    bool                      is_fullscreen() const;
    bool                      is_minimized() const;
    bool                      is_maximized() const;
    bool                      is_visible() const;
    std::string               title() const;

    // Not reported by the engine.
    bool                  is_focused() const { return false; }
    bool                  is_decorated() const { return false; }
    bool                  is_resizable() const { return true; }
    bool                  is_maximizable() const { return true; }
    bool                  is_minimizable() const { return true; }
    bool                  is_closable() const { return true; }
    bool                  is_enabled() const { return true; }
    bool                  is_always_on_top() const { return false; }
    Theme                 theme() const { return Theme::Light; }
    std::optional<Monitor> current_monitor() const { return std::nullopt; }

    // Owning-thread queries, marshalled through the event loop.
    std::optional<Monitor>   primary_monitor() const;
    std::optional<Monitor>   monitor_from_point(double x, double y) const;
    std::vector<Monitor>     available_monitors() const;
    PhysicalPosition<double> cursor_position() const;

    // ── Setters ──
    void set_title(const std::string& title) const;
    void maximize() const;
    void unmaximize() const;
    void minimize() const;
    void unminimize() const;
    void show() const;
    void hide() const;
    void set_size(const Size& size) const;
    void set_position(const Position& position) const;
    void set_fullscreen(bool fullscreen) const;
    void set_focus() const;
    void set_always_on_top(bool always_on_top) const;
    void start_dragging() const;

    // Asks to close: subscribers and the host may still veto.
    void close() const;

    // Closes without asking.
    void destroy() const;

    DetachedWindow create_window(PendingWindow pending) const;

    // Always throws RuntimeError(CreateWebview).
    DetachedWebview create_webview(PendingWebview pending) const;

    // Accepted, no effect.
    void center() const {}
    void request_user_attention(std::optional<UserAttentionType>) const {}
    void set_resizable(bool) const {}
    void set_maximizable(bool) const {}
    void set_minimizable(bool) const {}
    void set_closable(bool) const {}
    void set_decorations(bool) const {}
    void set_shadow(bool) const {}
    void set_always_on_bottom(bool) const {}
    void set_visible_on_all_workspaces(bool) const {}
    void set_content_protected(bool) const {}
    void set_min_size(std::optional<Size>) const {}
    void set_max_size(std::optional<Size>) const {}
    void set_icon(Icon) const {}
    void set_skip_taskbar(bool) const {}
    void set_cursor_grab(bool) const {}
    void set_cursor_visible(bool) const {}
    void set_cursor_icon(CursorIcon) const {}
    void set_cursor_position(const Position&) const {}
    void set_ignore_cursor_events(bool) const {}
    void start_resize_dragging() const {}
    void set_theme(std::optional<Theme>) const {}
    void set_enabled(bool) const {}
    void set_background_color(std::optional<std::array<uint8_t, 4>>) const {}
    void set_badge_count(std::optional<int64_t>) const {}

   private:
    WindowId                              id_;
    std::shared_ptr<DispatchContext>      context_;
    std::shared_ptr<EngineController>     engine_;
    std::shared_ptr<WindowEventListeners> listeners_;
};

// A created window as handed back to the host.
struct DetachedWindow
{
    WindowId                       id;
    std::string                    label;
    WindowDispatcher               dispatcher;
    std::optional<DetachedWebview> webview;
    bool                           use_https_scheme = false;
};

}   // namespace vesper
