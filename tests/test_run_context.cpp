#include "diagpack/collect/run_context.hpp"

#include <gtest/gtest.h>
#include <thread>

namespace diagpack {
namespace {

using namespace std::chrono_literals;

TEST(RunContextTest, ProgressOnlyMovesForward) {
    RunContext ctx;
    ctx.ReportProgress(10, "setup");
    ctx.ReportProgress(5, "stale");
    ctx.ReportProgress(10, "repeat");
    ctx.ReportProgress(150, "overshoot");

    const auto events = ctx.DrainEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].percent, 10);
    EXPECT_EQ(events[0].message, "setup");
    EXPECT_EQ(events[1].percent, 100);
    EXPECT_EQ(ctx.Progress(), 100);
}

TEST(RunContextTest, StateChangesCarryOutcome) {
    RunContext ctx;
    EXPECT_EQ(ctx.State(), RunState::Idle);
    ctx.EnterState(RunState::Preparing);
    ctx.EnterState(RunState::Finished, RunOutcome::Cancelled);

    EXPECT_EQ(ctx.State(), RunState::Finished);
    EXPECT_EQ(ctx.Outcome(), RunOutcome::Cancelled);

    const auto events = ctx.DrainEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, RunEvent::Type::StateChanged);
    EXPECT_EQ(events[1].outcome, RunOutcome::Cancelled);
}

TEST(RunContextTest, NotifyQueuesLogEvent) {
    RunContext ctx;
    Logger::Instance().SetLevel(LogLevel::None);
    ctx.Notify(LogLevel::Warn, "package %s: %d error(s)", "Net", 2);
    Logger::Instance().SetLevel(LogLevel::Info);

    auto ev = ctx.WaitForEvent(0ms);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->type, RunEvent::Type::Log);
    EXPECT_EQ(ev->level, LogLevel::Warn);
    EXPECT_EQ(ev->message, "package Net: 2 error(s)");
}

TEST(RunContextTest, NotifyKeepsLongMessagesWhole) {
    RunContext ctx;
    const std::string command(5000, 'c');
    Logger::Instance().SetLevel(LogLevel::None);
    ctx.Notify(LogLevel::Info, "running: %s (end)", command.c_str());
    Logger::Instance().SetLevel(LogLevel::Info);

    auto ev = ctx.WaitForEvent(0ms);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->message, "running: " + command + " (end)");
}

TEST(RunContextTest, WaitForEventWakesOnEmit) {
    RunContext ctx;
    std::thread producer([&] {
        std::this_thread::sleep_for(50ms);
        ctx.RequestCancel();
        ctx.EnterState(RunState::Finished, RunOutcome::Cancelled);
    });

    auto ev = ctx.WaitForEvent(5s);
    producer.join();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->state, RunState::Finished);
    EXPECT_TRUE(ctx.CancelRequested());
    EXPECT_FALSE(ctx.WaitForEvent(10ms).has_value());
}

} // namespace
} // namespace diagpack
