#include <gtest/gtest.h>

// CommandChannel is an internal header in src/runtime/
#include "runtime/command_channel.hpp"

#include <any>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace vesper;

static int user_value(Message& message)
{
    return std::any_cast<int>(std::get<Message::User>(message.payload()).event);
}

TEST(CommandChannel, InitiallyEmpty)
{
    CommandChannel channel;
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_FALSE(channel.is_closed());
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(CommandChannel, FIFO_Order)
{
    CommandChannel channel;
    for (int i = 1; i <= 3; ++i)
        EXPECT_TRUE(channel.push(Message::user_event(i)));
    EXPECT_EQ(channel.size(), 3u);

    std::deque<Message> batch;
    EXPECT_EQ(channel.take_all(batch), 3u);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(user_value(batch[0]), 1);
    EXPECT_EQ(user_value(batch[1]), 2);
    EXPECT_EQ(user_value(batch[2]), 3);
    EXPECT_TRUE(channel.empty());
}

TEST(CommandChannel, PushFailsAfterClose)
{
    CommandChannel channel;
    channel.close();
    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.push(Message::request_exit(0)));
}

TEST(CommandChannel, CloseDropsQueuedEnvelopes)
{
    auto channel = std::make_shared<CommandChannel>();
    auto promise = std::make_shared<std::promise<int>>();
    auto future  = promise->get_future();

    channel->push(Message::task([promise] { promise->set_value(1); }));
    promise.reset();
    channel->close();

    EXPECT_TRUE(channel->empty());
    // The closure (and the last promise reference) went with the envelope.
    EXPECT_THROW(future.get(), std::future_error);
}

TEST(CommandChannel, WaitAndTakeReturnsFalseWhenClosed)
{
    CommandChannel channel;
    std::thread    closer([&] { channel.close(); });

    std::deque<Message> batch;
    EXPECT_FALSE(channel.wait_and_take(batch));
    EXPECT_TRUE(batch.empty());
    closer.join();
}

TEST(CommandChannel, WaitAndTakeWakesOnPush)
{
    CommandChannel channel;
    std::thread    producer([&] { channel.push(Message::user_event(7)); });

    std::deque<Message> batch;
    EXPECT_TRUE(channel.wait_and_take(batch));
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(user_value(batch[0]), 7);
    producer.join();
}

TEST(CommandChannel, WaitAndTakeForTimesOut)
{
    CommandChannel      channel;
    std::deque<Message> batch;
    EXPECT_EQ(channel.wait_and_take_for(batch, std::chrono::milliseconds(10)), 0u);
}

TEST(CommandChannel, PerProducerOrderWithManyProducers)
{
    auto channel = std::make_shared<CommandChannel>();

    constexpr int            kProducers = 4;
    constexpr int            kPerThread = 200;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back(
            [channel, p]
            {
                CommandSender sender(channel);
                for (int i = 0; i < kPerThread; ++i)
                    sender.send(Message::user_event(p * 10000 + i));
            });
    }
    for (auto& t : producers)
        t.join();

    std::deque<Message> batch;
    channel->take_all(batch);
    ASSERT_EQ(batch.size(), static_cast<size_t>(kProducers * kPerThread));

    std::vector<int> last(kProducers, -1);
    for (auto& message : batch)
    {
        int v = user_value(message);
        int p = v / 10000;
        EXPECT_GT(v % 10000, last[p]);
        last[p] = v % 10000;
    }
}

TEST(CommandSender, DefaultIsClosed)
{
    CommandSender sender;
    EXPECT_TRUE(sender.is_closed());
    EXPECT_FALSE(sender.send(Message::request_exit(1)));
}

TEST(CommandSender, ReportsClosedChannel)
{
    auto          channel = std::make_shared<CommandChannel>();
    CommandSender sender(channel);
    EXPECT_TRUE(sender.send(Message::close_window(1)));
    channel->close();
    EXPECT_TRUE(sender.is_closed());
    EXPECT_FALSE(sender.send(Message::close_window(1)));
}

TEST(Message, OnlyUserEventsClone)
{
    auto user = Message::user_event(std::string("payload"));
    auto copy = user.try_clone();
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(std::any_cast<std::string>(std::get<Message::User>(copy->payload()).event), "payload");

    EXPECT_FALSE(Message::task([] {}).try_clone().has_value());
    EXPECT_FALSE(Message::close_window(3).try_clone().has_value());
    EXPECT_FALSE(Message::request_exit(0).try_clone().has_value());
}

TEST(Message, KindNames)
{
    EXPECT_STREQ(Message::task([] {}).kind_name(), "Task");
    EXPECT_STREQ(Message::task_with_event_loop([](EventLoopContext&) {}).kind_name(),
                 "TaskWithEventLoop");
    EXPECT_STREQ(Message::close_window(1).kind_name(), "CloseWindow");
    EXPECT_STREQ(Message::destroy_window(1).kind_name(), "DestroyWindow");
    EXPECT_STREQ(Message::request_exit(1).kind_name(), "RequestExit");
    EXPECT_STREQ(Message::user_event(1).kind_name(), "UserEvent");
}
