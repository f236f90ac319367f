#include <gtest/gtest.h>
#include <deploy/event_loop.hpp>
#include <memory>
#include <thread>
#include <vector>

TEST(EventLoopTest, RunsQueuedTasksInOrderThenReturns) {
    EventLoop loop;
    std::vector<int> seen;

    loop.post([&] { seen.push_back(1); });
    loop.post([&] { seen.push_back(2); loop.stop(); });
    loop.post([&] { seen.push_back(3); });
    loop.run();

    EXPECT_EQ(seen, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoopTest, TasksPostedFromTasksRunWithoutRecursion) {
    EventLoop loop;
    int depth = 0;
    int max_depth = 0;
    int remaining = 1000;

    std::function<void()> tick = [&] {
        depth++;
        max_depth = std::max(max_depth, depth);
        if (--remaining > 0) {
            loop.post(tick);
        } else {
            loop.stop();
        }
        depth--;
    };
    loop.post(tick);
    loop.run();

    EXPECT_EQ(remaining, 0);
    EXPECT_EQ(max_depth, 1);
}

TEST(EventLoopTest, AcceptsPostsFromOtherThreads) {
    EventLoop loop;
    int count = 0;

    std::thread producer([&] {
        for (int i = 0; i < 50; i++) loop.post([&] { count++; });
        loop.post([&] { loop.stop(); });
    });
    loop.run();
    producer.join();

    EXPECT_EQ(count, 50);
}

TEST(EventLoopTest, PollDoesNotBlock) {
    EventLoop loop;
    EXPECT_EQ(loop.poll(), 0u);

    int count = 0;
    loop.post([&] { count++; });
    loop.post([&] { count++; });
    EXPECT_EQ(loop.poll(), 2u);
    EXPECT_EQ(count, 2);
}

TEST(EventLoopTest, ReusableAfterStop) {
    EventLoop loop;
    int runs = 0;

    loop.post([&] { runs++; loop.stop(); });
    loop.run();
    loop.post([&] { runs++; loop.stop(); });
    loop.run();

    EXPECT_EQ(runs, 2);
}

TEST(EventLoopTest, DestroyedAsSoonAsRunReturns) {
    for (int i = 0; i < 200; i++) {
        auto loop = std::make_unique<EventLoop>();
        EventLoop* raw = loop.get();
        std::thread producer([raw] {
            raw->post([raw] { raw->stop(); });
        });
        loop->run();
        loop.reset();
        producer.join();
    }
}
