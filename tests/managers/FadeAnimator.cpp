#include <managers/FadeAnimator.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

static bool waitFor(const std::function<bool()>& cond, std::chrono::milliseconds timeout = 2000ms) {
    const auto END = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < END) {
        if (cond())
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return cond();
}

TEST(FadeAnimator, runsUntilStepReportsDone) {
    CFadeAnimator    animator(1ms);
    std::atomic<int> steps = 0;

    animator.start([&steps] { return ++steps >= 5; });

    EXPECT_TRUE(waitFor([&animator] { return !animator.active(); }));
    EXPECT_EQ(steps.load(), 5);
}

TEST(FadeAnimator, newSessionSupersedesOld) {
    CFadeAnimator    animator(1ms);
    std::atomic<int> oldSteps = 0, newSteps = 0;

    animator.start([&oldSteps] {
        ++oldSteps;
        return false;
    });

    EXPECT_TRUE(waitFor([&oldSteps] { return oldSteps > 0; }));

    const auto FIRST = animator.session();
    animator.start([&newSteps] { return ++newSteps >= 3; });
    EXPECT_GT(animator.session(), FIRST);

    const int OLDSNAPSHOT = oldSteps.load();

    EXPECT_TRUE(waitFor([&animator] { return !animator.active(); }));
    EXPECT_EQ(newSteps.load(), 3);

    // at most one old step was already in flight when we replaced it
    EXPECT_LE(oldSteps.load(), OLDSNAPSHOT + 1);
}

TEST(FadeAnimator, stopHaltsTicking) {
    CFadeAnimator    animator(1ms);
    std::atomic<int> steps = 0;

    animator.start([&steps] {
        ++steps;
        return false;
    });

    EXPECT_TRUE(waitFor([&steps] { return steps > 2; }));
    animator.stop();
    EXPECT_FALSE(animator.active());

    std::this_thread::sleep_for(20ms);
    const int AFTER = steps.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(steps.load(), AFTER);
}

TEST(FadeAnimator, destroysWhileRunning) {
    std::atomic<int> steps = 0;

    {
        CFadeAnimator animator(1ms);
        animator.start([&steps] {
            ++steps;
            return false;
        });
        waitFor([&steps] { return steps > 0; });
    }

    SUCCEED();
}
