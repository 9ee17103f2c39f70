#pragma once

#include "message.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace vesper
{

// MPSC queue of envelopes.  Any thread pushes; the owning thread waits and
// takes.  FIFO per producer.
//
// Once closed, push() fails and everything still queued is dropped.  Dropping
// an envelope destroys its closure, which breaks any reply promise it holds.
class CommandChannel
{
   public:
    CommandChannel() = default;

    CommandChannel(const CommandChannel&)            = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    // Producer side: enqueue an envelope.  Returns false if the channel is closed.
    bool push(Message message)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
                return false;
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    // Consumer side: dequeue one envelope without blocking.
    std::optional<Message> try_pop()
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
            return std::nullopt;
        Message message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    // Consumer side: move everything queued into `out` without blocking.
    size_t take_all(std::deque<Message>& out)
    {
        std::lock_guard lock(mutex_);
        return take_locked(out);
    }

    // Consumer side: block until something is queued or the channel closes,
    // then move everything queued into `out`.  Returns false once closed.
    bool wait_and_take(std::deque<Message>& out)
    {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (closed_)
            return false;
        take_locked(out);
        return true;
    }

    // As wait_and_take, giving up after `timeout`.  Returns the number taken.
    size_t wait_and_take_for(std::deque<Message>& out, std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        if (closed_)
            return 0;
        return take_locked(out);
    }

    void close()
    {
        std::deque<Message> dropped;
        {
            std::lock_guard lock(mutex_);
            if (closed_)
                return;
            closed_ = true;
            dropped.swap(queue_);
        }
        cv_.notify_all();
        // `dropped` is destroyed here, outside the lock.
    }

    bool is_closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    bool empty() const
    {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    size_t size() const
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

   private:
    size_t take_locked(std::deque<Message>& out)
    {
        size_t count = queue_.size();
        while (!queue_.empty())
        {
            out.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        return count;
    }

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::deque<Message>     queue_;
    bool                    closed_ = false;
};

// Cloneable producer handle.
class CommandSender
{
   public:
    CommandSender() = default;
    explicit CommandSender(std::shared_ptr<CommandChannel> channel)
        : channel_(std::move(channel))
    {
    }

    // False when the receiving side is gone.
    bool send(Message message) const
    {
        return channel_ && channel_->push(std::move(message));
    }

    bool is_closed() const { return !channel_ || channel_->is_closed(); }

   private:
    std::shared_ptr<CommandChannel> channel_;
};

}   // namespace vesper
