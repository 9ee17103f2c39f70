#pragma once

#include <vesper/dpi.hpp>
#include <vesper/engine.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vesper
{

struct Icon
{
    std::vector<uint8_t> rgba;
    uint32_t             width  = 0;
    uint32_t             height = 0;
};

// Declarative window description, as found in an application's config.
struct WindowConfig
{
    std::string           label = "main";
    std::string           title = "Vesper";
    double                width  = 800.0;
    double                height = 600.0;
    std::optional<double> x;
    std::optional<double> y;
    bool                  decorations  = true;
    bool                  transparent  = false;
    bool                  fullscreen   = false;
    bool                  maximized    = false;
    bool                  visible      = true;
    bool                  focus        = true;
    bool                  resizable    = true;
    bool                  always_on_top = false;
    std::optional<Theme>  theme;
};

// Fluent description of a window's initial state.
//
// Only the attributes the engine understands end up in engine_settings();
// the rest are accepted so host code written for native windows keeps
// compiling, and are ignored.
class WindowBuilder
{
   public:
    WindowBuilder() = default;

    // Title, size, position (only when both x and y are set), decorations,
    // transparency, fullscreen, maximized, visibility, focus and theme.
    static WindowBuilder with_config(const WindowConfig& config);

    WindowBuilder& title(std::string title);
    WindowBuilder& position(double x, double y);
    WindowBuilder& inner_size(double width, double height);
    WindowBuilder& decorations(bool decorations);
    WindowBuilder& transparent(bool transparent);
    WindowBuilder& fullscreen(bool fullscreen);
    WindowBuilder& maximized(bool maximized);
    WindowBuilder& visible(bool visible);
    WindowBuilder& focused(bool focused);
    WindowBuilder& theme(std::optional<Theme> theme);

    // Recorded for has_icon(); the engine draws its own icon.
    WindowBuilder& icon(Icon icon);

    // Accepted, no effect.
    WindowBuilder& center() { return *this; }
    WindowBuilder& min_inner_size(double, double) { return *this; }
    WindowBuilder& max_inner_size(double, double) { return *this; }
    WindowBuilder& resizable(bool) { return *this; }
    WindowBuilder& maximizable(bool) { return *this; }
    WindowBuilder& minimizable(bool) { return *this; }
    WindowBuilder& closable(bool) { return *this; }
    WindowBuilder& always_on_top(bool) { return *this; }
    WindowBuilder& always_on_bottom(bool) { return *this; }
    WindowBuilder& visible_on_all_workspaces(bool) { return *this; }
    WindowBuilder& content_protected(bool) { return *this; }
    WindowBuilder& skip_taskbar(bool) { return *this; }
    WindowBuilder& shadow(bool) { return *this; }
    WindowBuilder& window_classname(const std::string&) { return *this; }
    WindowBuilder& background_color(std::array<uint8_t, 4>) { return *this; }

    bool                  has_icon() const { return has_icon_; }
    std::optional<Theme>  get_theme() const { return settings_.theme; }
    const EngineSettings& engine_settings() const { return settings_; }

   private:
    EngineSettings settings_;
    bool           has_icon_ = false;
};

}   // namespace vesper
