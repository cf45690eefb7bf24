#include <gtest/gtest.h>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent>
#include <memory>

#include "plugins/command_executor.h"

using pm::plugins::CommandDescriptor;
using pm::plugins::CommandExecutor;
using pm::plugins::ExecutionResult;

namespace {

CommandDescriptor shell(const std::string &cmd) {
    CommandDescriptor d;
    d.useShell = true;
    d.shellCommand = cmd;
    return d;
}

CommandDescriptor direct(std::vector<std::string> argv) {
    CommandDescriptor d;
    d.useShell = false;
    d.argv = std::move(argv);
    return d;
}

} // namespace

TEST(CommandExecutorTest, ReportsExitCodes) {
    CommandExecutor executor;
    EXPECT_TRUE(executor.run(shell("exit 0")).succeeded());

    const ExecutionResult r = executor.run(shell("exit 3"));
    EXPECT_TRUE(r.started);
    EXPECT_FALSE(r.crashed);
    EXPECT_EQ(3, r.exitCode);
    EXPECT_FALSE(r.succeeded());
}

TEST(CommandExecutorTest, CapturesHiddenStderr) {
    CommandExecutor executor;
    CommandDescriptor d = shell("echo oops >&2; exit 1");
    d.showStderr = false;
    const ExecutionResult r = executor.run(d);
    EXPECT_EQ(1, r.exitCode);
    EXPECT_EQ(QByteArray("oops\n"), r.standardError);
}

TEST(CommandExecutorTest, ArgvIsNotInterpretedByAShell) {
    CommandExecutor executor;
    // Through a shell this would be `false | true`, which exits 0.
    const ExecutionResult r = executor.run(direct({"false", "|", "true"}));
    EXPECT_TRUE(r.started);
    EXPECT_NE(0, r.exitCode);

    EXPECT_EQ(0, executor.run(shell("false | true")).exitCode);
}

TEST(CommandExecutorTest, MissingExecutableIsNotStarted) {
    CommandExecutor executor;
    const ExecutionResult r = executor.run(direct({"/nonexistent/powermodes-test-binary"}));
    EXPECT_FALSE(r.started);
    EXPECT_FALSE(r.errorString.isEmpty());
    EXPECT_FALSE(r.succeeded());
}

TEST(CommandExecutorTest, SignalTerminationIsACrash) {
    CommandExecutor executor;
    const ExecutionResult r = executor.run(shell("kill -9 $$"));
    EXPECT_TRUE(r.started);
    EXPECT_TRUE(r.crashed);
    EXPECT_FALSE(r.succeeded());
}

TEST(CommandExecutorTest, StdinIsEmptyUnlessAllowed) {
    CommandExecutor executor;
    CommandDescriptor d = shell("read line; echo \"got:$line\" >&2; exit 7");
    d.showStderr = false;

    // A pool whose worker is stuck must not be destroyed, or teardown waits forever.
    auto pool = std::make_unique<QThreadPool>();
    QFuture<ExecutionResult> pending = QtConcurrent::run(pool.get(), [executor, d]() { return executor.run(d); });
    if (!pool->waitForDone(10000)) {
        pool.release();
        FAIL() << "child blocked on stdin";
    }
    const ExecutionResult r = pending.result();
    EXPECT_EQ(7, r.exitCode);
    EXPECT_EQ(QByteArray("got:\n"), r.standardError);
}
