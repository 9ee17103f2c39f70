#pragma once

#include <vesper/events.hpp>
#include <vesper/fwd.hpp>

#include <functional>
#include <optional>
#include <utility>
#include <variant>

namespace vesper
{

using Task              = std::function<void()>;
using TaskWithEventLoop = std::function<void(EventLoopContext&)>;

// Command envelope carried from any thread to the owning thread.
//
// Envelopes are move-only; only a user event can be duplicated.
class Message
{
   public:
    struct CloseWindow
    {
        WindowId id;
    };

    struct DestroyWindow
    {
        WindowId id;
    };

    struct RequestExit
    {
        int code;
    };

    struct User
    {
        UserEvent event;
    };

    using Payload =
        std::variant<Task, TaskWithEventLoop, CloseWindow, DestroyWindow, RequestExit, User>;

    static Message task(Task task)
    {
        return Message(Payload(std::in_place_type<Task>, std::move(task)));
    }

    static Message task_with_event_loop(TaskWithEventLoop task)
    {
        return Message(Payload(std::in_place_type<TaskWithEventLoop>, std::move(task)));
    }

    static Message close_window(WindowId id) { return Message(CloseWindow{id}); }
    static Message destroy_window(WindowId id) { return Message(DestroyWindow{id}); }
    static Message request_exit(int code) { return Message(RequestExit{code}); }
    static Message user_event(UserEvent event) { return Message(User{std::move(event)}); }

    Message(Message&&)            = default;
    Message& operator=(Message&&) = default;

    Message(const Message&)            = delete;
    Message& operator=(const Message&) = delete;

    // Copy of a user-event envelope; empty for every other kind.
    std::optional<Message> try_clone() const
    {
        if (const auto* user = std::get_if<User>(&payload_))
            return Message(User{user->event});
        return std::nullopt;
    }

    Payload&       payload() { return payload_; }
    const Payload& payload() const { return payload_; }

    const char* kind_name() const
    {
        switch (payload_.index())
        {
            case 0: return "Task";
            case 1: return "TaskWithEventLoop";
            case 2: return "CloseWindow";
            case 3: return "DestroyWindow";
            case 4: return "RequestExit";
            case 5: return "UserEvent";
            default: return "Unknown";
        }
    }

   private:
    explicit Message(Payload payload)
        : payload_(std::move(payload))
    {
    }

    Payload payload_;
};

}   // namespace vesper
