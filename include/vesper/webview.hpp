#pragma once

#include <vesper/dpi.hpp>
#include <vesper/fwd.hpp>
#include <vesper/http.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vesper
{

// Webview half of a window-creation request.
struct PendingWebview
{
    std::string url;

    // Scripts the engine runs in every document before page scripts.
    std::vector<std::string> initialization_scripts;

    // Custom-protocol handlers keyed by scheme, e.g. "tauri" or "asset".
    std::map<std::string, UriSchemeProtocolHandler> uri_scheme_protocols;

    // Decides whether a navigation may proceed.  Called on an engine thread.
    std::function<bool(const std::string& url)> navigation_handler;

    // https instead of http for the custom-protocol work-around.  Unset
    // falls back to RuntimeConfig::use_https_scheme.
    std::optional<bool> use_https_scheme;

    void register_uri_scheme_protocol(std::string scheme, UriSchemeProtocolHandler handler)
    {
        uri_scheme_protocols[std::move(scheme)] = std::move(handler);
    }
};

struct Cookie
{
    std::string name;
    std::string value;
};

// Webview event subscriptions are accepted but never fire.
using WebviewEventHandler = std::function<void()>;

// Cloneable handle for the webview inside a window.
//
// Delegated calls throw RuntimeError(FailedToSendMessage) when the engine
// does not answer.  The engine fills the whole window, so the webview has
// no geometry of its own: position() is always (0, 0) and the geometry
// setters have no effect.
class WebviewDispatcher
{
   public:
    WebviewDispatcher(WebviewId                         id,
                      std::shared_ptr<DispatchContext>  context,
                      std::shared_ptr<EngineController> engine);

    WebviewId id() const { return id_; }

    void run_on_main_thread(std::function<void()> task) const;

    WebviewEventId on_webview_event(WebviewEventHandler handler) const;

    void        eval_script(const std::string& script) const;
    std::string url() const;
    void        navigate(const std::string& url) const;
    void        reload() const;

    PhysicalSize<uint32_t>    size() const;
    PhysicalPosition<int32_t> position() const { return {}; }
    Rect                      bounds() const;

    // Accepted, no effect.
    void set_zoom(double) const {}
    void print() const {}
    void close() const {}
    void set_bounds(const Rect&) const {}
    void set_size(const Size&) const {}
    void set_position(const Position&) const {}
    void set_focus() const {}
    void show() const {}
    void hide() const {}
    void reparent(WindowId) const {}
    void set_auto_resize(bool) const {}
    void clear_all_browsing_data() const {}
    void set_background_color(std::optional<std::array<uint8_t, 4>>) const {}
    void open_devtools() const {}
    void close_devtools() const {}

    bool                is_devtools_open() const { return false; }
    std::vector<Cookie> cookies() const { return {}; }
    std::vector<Cookie> cookies_for_url(const std::string&) const { return {}; }

   private:
    WebviewId                         id_;
    std::shared_ptr<DispatchContext>  context_;
    std::shared_ptr<EngineController> engine_;
};

struct DetachedWebview
{
    std::string       label;
    WebviewDispatcher dispatcher;
};

}   // namespace vesper
