#include <gtest/gtest.h>

#include "util/runtime_fixture.hpp"

#include <vesper/error.hpp>

#include <any>
#include <atomic>
#include <chrono>
#include <thread>

using namespace vesper;
using namespace vesper::test;

using EventLoopTest = RuntimeFixture;

TEST_F(EventLoopTest, ReadyIsEmittedOnce)
{
    EXPECT_TRUE(runtime_->run_iteration(recorder()));
    EXPECT_TRUE(runtime_->run_iteration(recorder()));
    EXPECT_EQ(events_,
              (std::vector<std::string>{"Ready",
                                        "Resumed",
                                        "MainEventsCleared",
                                        "Resumed",
                                        "MainEventsCleared"}));
}

TEST_F(EventLoopTest, BatchIsBracketed)
{
    auto proxy = runtime_->create_proxy();
    proxy.send_event(1);
    proxy.send_event(2);

    std::vector<int> values;
    runtime_->run_iteration(recorder(
        [&](const RunEvent& event)
        {
            if (auto* user = std::get_if<RunUserEvent>(&event))
                values.push_back(std::any_cast<int>(user->event));
        }));

    EXPECT_EQ(events_,
              (std::vector<std::string>{"Ready", "Resumed", "User", "User", "MainEventsCleared"}));
    EXPECT_EQ(values, (std::vector<int>{1, 2}));
}

TEST_F(EventLoopTest, UserEventsFromManyThreadsKeepPerThreadOrder)
{
    constexpr int kThreads = 3;
    constexpr int kEach    = 50;

    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t)
    {
        senders.emplace_back(
            [proxy = runtime_->create_proxy(), t]
            {
                for (int i = 0; i < kEach; ++i)
                    proxy.send_event(std::make_pair(t, i));
            });
    }
    for (auto& s : senders)
        s.join();

    std::vector<int> last(kThreads, -1);
    int              count = 0;
    runtime_->run_iteration(
        [&](const RunEvent& event)
        {
            if (auto* user = std::get_if<RunUserEvent>(&event))
            {
                auto [t, i] = std::any_cast<std::pair<int, int>>(user->event);
                EXPECT_EQ(i, last[t] + 1);
                last[t] = i;
                ++count;
            }
        });
    EXPECT_EQ(count, kThreads * kEach);
}

TEST_F(EventLoopTest, RequestExitReturnsCode)
{
    auto        handle = runtime_->handle();
    std::thread requester([handle] { handle.request_exit(7); });

    int code = runtime_->run(recorder());
    requester.join();

    EXPECT_EQ(code, 7);
    auto events = interesting_events();
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events.front(), "Ready");
    EXPECT_EQ(events[events.size() - 2], "ExitRequested(7)");
    EXPECT_EQ(events.back(), "Exit");
}

TEST_F(EventLoopTest, RequestExitCanBePrevented)
{
    auto handle = runtime_->handle();
    handle.request_exit(1);
    handle.request_exit(2);

    int  prevented = 0;
    int  code      = runtime_->run(
        [&](const RunEvent& event)
        {
            if (auto* exit = std::get_if<ExitRequestedEvent>(&event))
            {
                if (exit->code == 1)
                {
                    exit->prevent_exit();
                    ++prevented;
                }
            }
        });

    EXPECT_EQ(prevented, 1);
    EXPECT_EQ(code, 2);
}

TEST_F(EventLoopTest, LastWindowCloseExitsWithZero)
{
    auto window = runtime_->create_window(make_pending("main"));
    window.dispatcher.close();
    EXPECT_EQ(runtime_->run(recorder()), 0);
}

TEST_F(EventLoopTest, ExitShutsDownRemainingWindows)
{
    runtime_->create_window(make_pending("a"));
    runtime_->create_window(make_pending("b"));
    runtime_->handle().request_exit(0);

    runtime_->run(recorder());
    EXPECT_EQ(runtime_->window_count(), 0u);
    EXPECT_EQ(launcher_->total_exits(), 2);
}

TEST_F(EventLoopTest, EnvelopesAfterExitAreDropped)
{
    auto proxy = runtime_->create_proxy();
    runtime_->handle().request_exit(0);
    proxy.send_event(1);   // same batch, after the exit request

    int users = 0;
    runtime_->run(
        [&](const RunEvent& event)
        {
            if (std::holds_alternative<RunUserEvent>(event))
                ++users;
        });
    EXPECT_EQ(users, 0);

    try
    {
        proxy.send_event(2);
        FAIL() << "expected FailedToSendMessage";
    }
    catch (const RuntimeError& e)
    {
        EXPECT_EQ(e.code(), ErrorCode::FailedToSendMessage);
    }
}

TEST_F(EventLoopTest, BlockingQueryQueuedBehindExitFails)
{
    monitors_->monitors = {make_monitor("only", 0, 0, 1920, 1080)};

    auto handle = runtime_->handle();
    handle.request_exit(3);

    std::optional<ErrorCode> code;
    std::thread              worker(
        [&, handle]
        {
            try
            {
                handle.available_monitors();
            }
            catch (const RuntimeError& e)
            {
                code = e.code();
            }
        });

    // Let the query land in the same batch as the exit request.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(runtime_->run_iteration(recorder()));
    worker.join();

    EXPECT_EQ(code, ErrorCode::FailedToReceiveMessage);
    EXPECT_EQ(runtime_->run(recorder()), 3);
}

TEST_F(EventLoopTest, RunAfterExitReturnsStoredCode)
{
    runtime_->handle().request_exit(4);
    EXPECT_EQ(runtime_->run(recorder()), 4);

    events_.clear();
    EXPECT_EQ(runtime_->run(recorder()), 4);
    EXPECT_TRUE(events_.empty());
}

TEST_F(EventLoopTest, RunOffOwningThreadThrows)
{
    std::optional<ErrorCode> code;
    std::thread              worker(
        [&]
        {
            try
            {
                runtime_->run_iteration([](const RunEvent&) {});
            }
            catch (const RuntimeError& e)
            {
                code = e.code();
            }
        });
    worker.join();
    EXPECT_EQ(code, ErrorCode::WrongThread);
}

TEST_F(EventLoopTest, RunOnMainThreadFromWorker)
{
    const auto       owner = std::this_thread::get_id();
    std::atomic<bool> on_owner{false};

    auto        handle = runtime_->handle();
    std::thread worker(
        [handle, owner, &on_owner]
        {
            handle.run_on_main_thread(
                [owner, &on_owner, handle]
                {
                    on_owner = std::this_thread::get_id() == owner;
                    handle.request_exit(0);
                });
        });

    runtime_->run(recorder());
    worker.join();
    EXPECT_TRUE(on_owner.load());
}

TEST_F(EventLoopTest, BlockingQueryFromWorkerDuringRun)
{
    monitors_->monitors = {make_monitor("left", 0, 0, 1920, 1080),
                           make_monitor("right", 1920, 0, 1280, 1024)};

    auto                       handle = runtime_->handle();
    std::vector<Monitor>       seen;
    std::optional<Monitor>     at_point;
    std::thread                worker(
        [&, handle]
        {
            seen     = handle.available_monitors();
            at_point = handle.monitor_from_point(2000, 10);
            handle.request_exit(0);
        });

    runtime_->run(recorder());
    worker.join();

    ASSERT_EQ(seen.size(), 2u);
    ASSERT_TRUE(at_point.has_value());
    EXPECT_EQ(at_point->name, "right");
}

TEST_F(EventLoopTest, BlockingQueryAfterExitFails)
{
    runtime_->handle().request_exit(0);
    runtime_->run(recorder());

    auto                     handle = runtime_->handle();
    std::optional<ErrorCode> code;
    std::thread              worker(
        [&, handle]
        {
            try
            {
                handle.primary_monitor();
            }
            catch (const RuntimeError& e)
            {
                code = e.code();
            }
        });
    worker.join();
    ASSERT_TRUE(code.has_value());
    EXPECT_TRUE(*code == ErrorCode::FailedToSendMessage || *code == ErrorCode::FailedToReceiveMessage);
}
