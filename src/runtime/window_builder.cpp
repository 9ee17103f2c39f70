#include <vesper/window_builder.hpp>

namespace vesper
{

WindowBuilder WindowBuilder::with_config(const WindowConfig& config)
{
    WindowBuilder builder;
    builder.title(config.title)
        .inner_size(config.width, config.height)
        .decorations(config.decorations)
        .transparent(config.transparent)
        .fullscreen(config.fullscreen)
        .maximized(config.maximized)
        .visible(config.visible)
        .focused(config.focus)
        .theme(config.theme)
        .resizable(config.resizable)
        .always_on_top(config.always_on_top);

    if (config.x && config.y)
        builder.position(*config.x, *config.y);

    return builder;
}

WindowBuilder& WindowBuilder::title(std::string title)
{
    settings_.title = std::move(title);
    return *this;
}

WindowBuilder& WindowBuilder::position(double x, double y)
{
    settings_.position = LogicalPosition{x, y};
    return *this;
}

WindowBuilder& WindowBuilder::inner_size(double width, double height)
{
    settings_.inner_size = LogicalSize{width, height};
    return *this;
}

WindowBuilder& WindowBuilder::decorations(bool decorations)
{
    settings_.decorated = decorations;
    return *this;
}

WindowBuilder& WindowBuilder::transparent(bool transparent)
{
    settings_.transparent = transparent;
    return *this;
}

WindowBuilder& WindowBuilder::fullscreen(bool fullscreen)
{
    settings_.fullscreen = fullscreen;
    return *this;
}

WindowBuilder& WindowBuilder::maximized(bool maximized)
{
    settings_.maximized = maximized;
    return *this;
}

WindowBuilder& WindowBuilder::visible(bool visible)
{
    settings_.visible = visible;
    return *this;
}

WindowBuilder& WindowBuilder::focused(bool focused)
{
    settings_.focused = focused;
    return *this;
}

WindowBuilder& WindowBuilder::theme(std::optional<Theme> theme)
{
    settings_.theme = theme;
    return *this;
}

WindowBuilder& WindowBuilder::icon(Icon)
{
    has_icon_ = true;
    return *this;
}

}   // namespace vesper
