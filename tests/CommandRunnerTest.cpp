#include <gtest/gtest.h>
#include "CommandRunner.hpp"

using namespace TrapWatch;

TEST(CommandRunnerTest, CapturesOutputAndExitStatus) {
    CommandResult ok = runCommand("echo hello");
    EXPECT_EQ(ok.exitCode, 0);
    EXPECT_EQ(ok.output, "hello\n");

    CommandResult failed = runCommand("exit 3");
    EXPECT_EQ(failed.exitCode, 3);

    CommandResult missing = runCommand("trapwatch-no-such-tool 2>/dev/null");
    EXPECT_EQ(missing.exitCode, 127);
}

TEST(CommandRunnerTest, ShellQuoteSurvivesTheShell) {
    const std::string tricky = "cam 1/it's $HOME `id`.jpg";
    CommandResult result = runCommand("printf %s " + shellQuote(tricky));
    EXPECT_EQ(result.output, tricky);
}
