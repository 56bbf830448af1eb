#include "diagpack/collect/process_launcher.hpp"

#include <chrono>
#include <gtest/gtest.h>

namespace diagpack {
namespace {

using namespace std::chrono_literals;

TEST(PosixProcessLauncherTest, CapturesStdoutAndStderr) {
    PosixProcessLauncher launcher;
    auto res = launcher.Run({"/bin/sh", "-c", "echo out; echo err 1>&2"}, 5s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->exit_code, 0);
    EXPECT_FALSE(res->timed_out);
    EXPECT_NE(res->output.find("out\n"), std::string::npos);
    EXPECT_NE(res->output.find("err\n"), std::string::npos);
}

TEST(PosixProcessLauncherTest, ReportsExitCode) {
    PosixProcessLauncher launcher;
    auto res = launcher.Run({"/bin/sh", "-c", "exit 7"}, 5s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->exit_code, 7);
    EXPECT_FALSE(res->timed_out);
}

TEST(PosixProcessLauncherTest, ResolvesNamesThroughPath) {
    PosixProcessLauncher launcher;
    auto res = launcher.Run({"sh", "-c", "printf abc"}, 5s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->output, "abc");
}

TEST(PosixProcessLauncherTest, StdinIsEmpty) {
    PosixProcessLauncher launcher;
    auto res = launcher.Run({"/bin/sh", "-c", "cat; echo done"}, 5s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->output, "done\n");
}

TEST(PosixProcessLauncherTest, TimeoutKillsProcessGroup) {
    PosixProcessLauncher launcher;
    const auto start = std::chrono::steady_clock::now();
    auto res = launcher.Run({"/bin/sh", "-c", "echo started; sleep 30 & sleep 30"}, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_TRUE(res->timed_out);
    EXPECT_NE(res->exit_code, 0);
    EXPECT_NE(res->output.find("started"), std::string::npos);
    EXPECT_LT(elapsed, 10s);
}

TEST(PosixProcessLauncherTest, FloodingOutputStaysWithinLimit) {
    PosixProcessLauncher launcher(64 * 1024);
    auto res = launcher.Run({"/bin/sh", "-c", "yes"}, 500ms);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_TRUE(res->timed_out);
    EXPECT_TRUE(res->truncated);
    EXPECT_EQ(res->output.size(), 64u * 1024);
    EXPECT_EQ(res->output.substr(0, 4), "y\ny\n");
}

TEST(PosixProcessLauncherTest, OutputPastLimitIsDrainedUntilExit) {
    PosixProcessLauncher launcher(16);
    auto res = launcher.Run({"/bin/sh", "-c", "head -c 200000 /dev/zero; echo end"}, 10s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_FALSE(res->timed_out);
    EXPECT_EQ(res->exit_code, 0);
    EXPECT_TRUE(res->truncated);
    EXPECT_EQ(res->output.size(), 16u);
}

TEST(PosixProcessLauncherTest, SmallOutputIsNotTruncated) {
    PosixProcessLauncher launcher(4);
    auto res = launcher.Run({"/bin/sh", "-c", "printf abcd"}, 5s);
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_FALSE(res->truncated);
    EXPECT_EQ(res->output, "abcd");
}

TEST(PosixProcessLauncherTest, EndsWhenChildExitsDespiteBackgroundHolder) {
    PosixProcessLauncher launcher;
    const auto start = std::chrono::steady_clock::now();
    auto res = launcher.Run({"/bin/sh", "-c", "(sleep 30 &); echo done"}, 5s);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_FALSE(res->timed_out);
    EXPECT_EQ(res->exit_code, 0);
    EXPECT_EQ(res->output, "done\n");
    EXPECT_LT(elapsed, 4s);
}

TEST(PosixProcessLauncherTest, MissingExecutableIsLaunchError) {
    PosixProcessLauncher launcher;
    auto res = launcher.Run({"/nonexistent/diagpack-tool"}, 1s);
    EXPECT_FALSE(res.has_value());

    auto by_name = launcher.Run({"diagpack-no-such-program-xyz"}, 1s);
    EXPECT_FALSE(by_name.has_value());

    auto empty = launcher.Run({}, 1s);
    EXPECT_FALSE(empty.has_value());
}

TEST(PosixProcessLauncherTest, ResolveExecutable) {
    EXPECT_EQ(PosixProcessLauncher::ResolveExecutable("/bin/sh"), "/bin/sh");
    EXPECT_FALSE(PosixProcessLauncher::ResolveExecutable("sh").empty());
    EXPECT_TRUE(PosixProcessLauncher::ResolveExecutable("").empty());
    EXPECT_TRUE(PosixProcessLauncher::ResolveExecutable("diagpack-no-such-program-xyz").empty());
}

} // namespace
} // namespace diagpack
