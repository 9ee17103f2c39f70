#pragma once

#include <vesper/engine.hpp>
#include <vesper/events.hpp>
#include <vesper/fwd.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vesper
{

// Window-event subscribers of one window.  Shared between the registry entry
// and every WindowDispatcher of that window.
struct WindowEventListeners
{
    void add(WindowEventId id, WindowEventHandler handler)
    {
        std::lock_guard lock(mutex);
        handlers[id] = std::move(handler);
    }

    // Copies the handlers out so they can run without the lock held.
    std::vector<WindowEventHandler> snapshot() const
    {
        std::lock_guard                 lock(mutex);
        std::vector<WindowEventHandler> out;
        out.reserve(handlers.size());
        for (const auto& [id, handler] : handlers)
            out.push_back(handler);
        return out;
    }

    void clear()
    {
        std::map<WindowEventId, WindowEventHandler> dropped;
        {
            std::lock_guard lock(mutex);
            dropped.swap(handlers);
        }
    }

    size_t size() const
    {
        std::lock_guard lock(mutex);
        return handlers.size();
    }

    mutable std::mutex                          mutex;
    std::map<WindowEventId, WindowEventHandler> handlers;
};

struct WindowState
{
    std::string                           label;
    std::shared_ptr<EngineController>     engine;
    std::shared_ptr<WindowEventListeners> listeners;
};

// Live windows by id.
// Thread-safe: all public methods lock the internal mutex.  Nothing is
// called back while the lock is held.
class WindowRegistry
{
   public:
    // What a close request needs: no strong engine reference.
    struct CloseTarget
    {
        std::string                           label;
        std::shared_ptr<WindowEventListeners> listeners;
    };

    void insert(WindowId id, WindowState state);

    std::optional<WindowState> remove(WindowId id);
    std::optional<CloseTarget> close_target(WindowId id) const;

    std::optional<std::string> label(WindowId id) const;
    bool                       contains(WindowId id) const;
    size_t                     size() const;
    bool                       empty() const;
    std::vector<WindowId>      ids() const;

    // Empties the registry, handing every entry to the caller.
    std::vector<std::pair<WindowId, WindowState>> take_all();

   private:
    mutable std::mutex                        mutex_;
    std::unordered_map<WindowId, WindowState> windows_;
};

}   // namespace vesper
