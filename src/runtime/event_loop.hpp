#pragma once

#include "command_channel.hpp"
#include "dispatch_context.hpp"

#include <vesper/events.hpp>

#include <deque>
#include <memory>

namespace vesper
{

// Drives the owning thread: takes envelopes off the channel and turns them
// into run events for the host callback.
class EventLoop
{
   public:
    EventLoop(std::shared_ptr<CommandChannel>   channel,
              std::shared_ptr<DispatchContext>  context,
              std::shared_ptr<EventLoopContext> loop_context);

    EventLoop(const EventLoop&)            = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Blocks until the loop exits; returns the exit code.
    int run(const RunCallback& callback);

    // One pass over whatever is queued.  False once the loop has exited.
    bool run_iteration(const RunCallback& callback);

    // Closes the channel and shuts down any windows left, without events.
    // For a runtime destroyed before its loop finished.
    void abandon();

    bool has_exited() const { return exited_; }
    int  exit_code() const { return exit_code_; }

   private:
    void start(const RunCallback& callback);

    // Executes one batch between Resumed and MainEventsCleared.  Returns
    // whether the loop should exit.
    bool process(std::deque<Message>& batch, const RunCallback& callback);

    bool handle(Message& message, const RunCallback& callback);
    void finish(const RunCallback& callback);

    std::shared_ptr<CommandChannel>   channel_;
    std::shared_ptr<DispatchContext>  context_;
    std::shared_ptr<EventLoopContext> loop_context_;

    bool started_   = false;
    bool exited_    = false;
    int  exit_code_ = 0;
};

}   // namespace vesper
