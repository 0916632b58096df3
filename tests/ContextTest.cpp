#include <edgebridge/Context.hpp>
#include <gtest/gtest.h>
#include <thread>

using namespace edgebridge;
using namespace std::chrono;

TEST(ContextTest, BackgroundNeverCancels) {
    Context ctx = Context::background();
    EXPECT_FALSE(ctx.is_cancelled());
    EXPECT_FALSE(ctx.has_deadline());
    EXPECT_EQ(ctx.remaining(milliseconds(123)), milliseconds(123));
    EXPECT_FALSE(ctx.wait_for(milliseconds(5)));
}

/**
 * @brief 取消向下传递，不向上传递
 */
TEST(ContextTest, CancelPropagatesToChildrenOnly) {
    Context parent = Context::with_cancel(Context::background());
    Context child = Context::with_cancel(parent);
    Context grandchild = Context::with_timeout(child, seconds(10));

    Context sibling = Context::with_cancel(parent);
    sibling.cancel();
    EXPECT_FALSE(parent.is_cancelled());

    parent.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(grandchild.is_cancelled());
}

TEST(ContextTest, ChildOfCancelledParentStartsCancelled) {
    Context parent = Context::with_cancel(Context::background());
    parent.cancel();
    EXPECT_TRUE(Context::with_cancel(parent).is_cancelled());
}

TEST(ContextTest, TimeoutExpires) {
    Context ctx = Context::with_timeout(Context::background(), milliseconds(30));
    EXPECT_TRUE(ctx.has_deadline());

    const auto begin = steady_clock::now();
    EXPECT_TRUE(ctx.wait_for(seconds(5)));
    EXPECT_LT(steady_clock::now() - begin, seconds(2));
    EXPECT_TRUE(ctx.is_cancelled());
    EXPECT_EQ(ctx.remaining(seconds(1)), milliseconds(0));
}

TEST(ContextTest, ChildDeadlineNeverExceedsParent) {
    Context parent = Context::with_timeout(Context::background(), milliseconds(200));
    Context child = Context::with_timeout(parent, seconds(60));
    EXPECT_LE(child.remaining(seconds(60)), milliseconds(200));
}

TEST(ContextTest, AnyOfCancelsWhenEitherParentCancels) {
    Context first = Context::with_cancel(Context::background());
    Context second = Context::with_cancel(Context::background());
    Context merged = Context::any_of(first, second);

    EXPECT_FALSE(merged.is_cancelled());
    second.cancel();
    EXPECT_TRUE(merged.is_cancelled());
    EXPECT_FALSE(first.is_cancelled());
}

TEST(ContextTest, AnyOfInheritsEarlierDeadline) {
    Context first = Context::background();
    Context second = Context::with_timeout(Context::background(), milliseconds(100));
    Context merged = Context::any_of(first, second);
    EXPECT_TRUE(merged.has_deadline());
}

/**
 * @brief 另一个线程取消时 wait_for 立即返回
 */
TEST(ContextTest, CancelWakesWaiter) {
    Context ctx = Context::with_cancel(Context::background());
    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(milliseconds(20));
        ctx.cancel();
    });

    const auto begin = steady_clock::now();
    EXPECT_TRUE(ctx.wait_for(seconds(10)));
    EXPECT_LT(steady_clock::now() - begin, seconds(5));
    canceller.join();
}
