#include <gtest/gtest.h>

#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "dispatcher/Dispatcher.hpp"

using negotiator::dispatch::Dispatcher;

TEST(DispatcherTest, RunsTasksInPostOrderOnOneThread) {
    Dispatcher dispatcher;
    dispatcher.start();

    std::vector<int> order;
    std::vector<std::thread::id> threads;
    std::promise<void> done;
    for (int i = 0; i < 5; ++i) {
        dispatcher.post([&, i]() {
            order.push_back(i);
            threads.push_back(std::this_thread::get_id());
        });
    }
    dispatcher.post([&]() { done.set_value(); });
    done.get_future().wait();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    for (const auto& id : threads) {
        EXPECT_EQ(id, threads.front());
        EXPECT_NE(id, std::this_thread::get_id());
    }
}

TEST(DispatcherTest, ReportsCurrentThread) {
    Dispatcher dispatcher;
    dispatcher.start();
    EXPECT_FALSE(dispatcher.isCurrentThread());

    std::promise<bool> inside;
    dispatcher.post([&]() { inside.set_value(dispatcher.isCurrentThread()); });
    EXPECT_TRUE(inside.get_future().get());
}

TEST(DispatcherTest, StopRunsPendingTasks) {
    Dispatcher dispatcher;
    int ran = 0;
    dispatcher.post([&]() { ++ran; });
    dispatcher.post([&]() { ++ran; });
    dispatcher.start();
    dispatcher.stop();
    EXPECT_EQ(ran, 2);
}

TEST(DispatcherTest, ThrowingTaskDoesNotStopWorker) {
    Dispatcher dispatcher;
    dispatcher.start();

    std::promise<void> done;
    dispatcher.post([]() { throw std::runtime_error("boom"); });
    dispatcher.post([&]() { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}
