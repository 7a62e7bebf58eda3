#include <gtest/gtest.h>

#include <stdexcept>

#include "sacore/transition_queue.hpp"

using namespace sacore;

TEST(TransitionQueue, RunsImmediatelyWhenIdle) {
    TransitionQueue queue;
    bool ran = false;
    queue.submit([&ran]() { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_FALSE(queue.isDraining());
    EXPECT_EQ(queue.pendingCount(), 0);
}

TEST(TransitionQueue, NestedSubmissionRunsAfterCurrentOperation) {
    TransitionQueue queue;
    QStringList order;
    queue.submit([&]() {
        order.append("first:begin");
        queue.submit([&]() {
            order.append("second");
            queue.submit([&]() { order.append("third"); });
        });
        EXPECT_EQ(queue.pendingCount(), 1);
        order.append("first:end");
    });
    EXPECT_EQ(order, (QStringList {"first:begin", "first:end", "second", "third"}));
}

TEST(TransitionQueue, ThrowingOperationDoesNotBlockTheQueue) {
    TransitionQueue queue;
    bool ranAfter = false;
    queue.submit([&]() {
        queue.submit([&ranAfter]() { ranAfter = true; });
        throw std::runtime_error("device exploded");
    });
    EXPECT_TRUE(ranAfter);
    EXPECT_FALSE(queue.isDraining());

    bool ranLater = false;
    queue.submit([&ranLater]() { ranLater = true; });
    EXPECT_TRUE(ranLater);
}
