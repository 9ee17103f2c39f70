#pragma once

#include <any>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace vesper
{

// Application-defined payload carried through EventLoopProxy::send_event.
using UserEvent = std::any;

// One-shot answer channel handed to event handlers.  Copies share state.
// The first value sent is the answer; later sends are ignored.
template <typename T>
class OneShotSignal
{
   public:
    OneShotSignal()
        : state_(std::make_shared<State>())
    {
    }

    void send(T value) const
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->value)
            state_->value = std::move(value);
    }

    std::optional<T> try_receive() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->value;
    }

   private:
    struct State
    {
        std::mutex       mutex;
        std::optional<T> value;
    };
    std::shared_ptr<State> state_;
};

// Answer channel for a close request.  Copies share state.  true prevents
// the close; once a true has been sent it stays, whatever else is sent.
class CloseSignal
{
   public:
    CloseSignal()
        : state_(std::make_shared<State>())
    {
    }

    void send(bool prevent) const
    {
        std::lock_guard lock(state_->mutex);
        if (prevent || !state_->value)
            state_->value = prevent;
    }

    std::optional<bool> try_receive() const
    {
        std::lock_guard lock(state_->mutex);
        return state_->value;
    }

    bool prevented() const { return try_receive().value_or(false); }

   private:
    struct State
    {
        std::mutex          mutex;
        std::optional<bool> value;
    };
    std::shared_ptr<State> state_;
};

enum class ExitRequestedAction
{
    Prevent,
};

using ExitSignal = OneShotSignal<ExitRequestedAction>;

// ─── Window events ──────────────────────────────────────────────────────────

struct CloseRequestedEvent
{
    CloseSignal signal;

    void prevent_close() const { signal.send(true); }
};

struct DestroyedEvent
{
};

using WindowEvent        = std::variant<CloseRequestedEvent, DestroyedEvent>;
using WindowEventHandler = std::function<void(const WindowEvent&)>;

// ─── Run events (delivered to the host callback) ────────────────────────────

struct ReadyEvent
{
};

struct ResumedEvent
{
};

struct MainEventsClearedEvent
{
};

struct ExitEvent
{
};

// `code` is set when the host called request_exit, empty when the last
// window closed.
struct ExitRequestedEvent
{
    std::optional<int> code;
    ExitSignal         signal;

    void prevent_exit() const { signal.send(ExitRequestedAction::Prevent); }
};

struct RunWindowEvent
{
    std::string label;
    WindowEvent event;
};

struct RunUserEvent
{
    UserEvent event;
};

using RunEvent = std::variant<ReadyEvent,
                              ResumedEvent,
                              MainEventsClearedEvent,
                              ExitEvent,
                              ExitRequestedEvent,
                              RunWindowEvent,
                              RunUserEvent>;

using RunCallback = std::function<void(const RunEvent&)>;

}   // namespace vesper
