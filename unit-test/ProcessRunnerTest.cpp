#include <signal.h>
#include <filesystem>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "process/run.hpp"

using namespace std;
using namespace atst;

class ProcessRunnerTest : public ::testing::Test {
protected:
    run_options shell(const string &script, chrono::milliseconds timeout = chrono::milliseconds(5000)) {
        run_options opt;
        opt.command = {"sh", "-c", script};
        opt.timeout = timeout;
        opt.stream_size = 1 << 20;
        return opt;
    }
};

TEST_F(ProcessRunnerTest, ArgumentsTest) {
    run_options opt;
    opt.command = {"echo", "hello", "world"};
    opt.timeout = chrono::milliseconds(5000);
    opt.stream_size = 1 << 20;
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.out, "hello world\n");
    EXPECT_EQ(result.err, "");
}

TEST_F(ProcessRunnerTest, StandardInputTest) {
    run_options opt;
    opt.command = {"cat"};
    opt.stdin_content = "line 1\nline 2\n";
    opt.timeout = chrono::milliseconds(5000);
    opt.stream_size = 1 << 20;
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.out, "line 1\nline 2\n");
}

TEST_F(ProcessRunnerTest, EmptyStandardInputTest) {
    run_options opt;
    opt.command = {"cat"};
    opt.timeout = chrono::milliseconds(5000);
    opt.stream_size = 1 << 20;
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.out, "");
}

TEST_F(ProcessRunnerTest, LargeStandardInputTest) {
    run_options opt;
    opt.command = {"cat"};
    opt.stdin_content = string(1 << 20, 'x');
    opt.timeout = chrono::milliseconds(5000);
    opt.stream_size = 4 << 20;
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.out.size(), (size_t)(1 << 20));
}

TEST_F(ProcessRunnerTest, IgnoredStandardInputTest) {
    auto opt = shell("exit 0");
    opt.stdin_content = string(1 << 20, 'x');
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.exitcode, 0);
}

TEST_F(ProcessRunnerTest, ExitCodeTest) {
    auto result = run_process(shell("echo out; echo err >&2; exit 3"));
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.exitcode, 3);
    EXPECT_EQ(result.out, "out\n");
    EXPECT_EQ(result.err, "err\n");
}

TEST_F(ProcessRunnerTest, SignaledTest) {
    auto result = run_process(shell("echo before; kill -SEGV $$"));
    EXPECT_TRUE(result.signaled());
    EXPECT_EQ(result.signal, SIGSEGV);
    EXPECT_EQ(result.out, "before\n");
}

TEST_F(ProcessRunnerTest, TimeoutTest) {
    auto result = run_process(shell("echo partial; sleep 10", chrono::milliseconds(300)));
    EXPECT_TRUE(result.timed_out());
    EXPECT_EQ(result.out, "partial\n");
    EXPECT_LT(result.wall_time, 5);
    EXPECT_GE(result.wall_time, 0.3);
}

TEST_F(ProcessRunnerTest, DescendantsKilledTest) {
    // 后台进程继承了标准输出，父进程退出后它也必须被杀死，否则会一直占用管道
    auto result = run_process(shell("(sleep 10; echo late) & echo quick"));
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.out, "quick\n");
    EXPECT_LT(result.wall_time, 5);
}

TEST_F(ProcessRunnerTest, OutputLimitTest) {
    auto opt = shell("i=0; while [ $i -lt 100 ]; do printf 0123456789; i=$((i+1)); done");
    opt.stream_size = 10;
    auto result = run_process(opt);
    EXPECT_TRUE(result.exited());
    EXPECT_EQ(result.out, "0123456789");
    EXPECT_TRUE(result.out_truncated);
    EXPECT_FALSE(result.err_truncated);
}

TEST_F(ProcessRunnerTest, WorkingDirectoryTest) {
    filesystem::path dir = filesystem::canonical(WORK_DIR);
    auto opt = shell("pwd");
    opt.working_directory = dir;
    auto result = run_process(opt);
    EXPECT_EQ(result.out, dir.string() + "\n");
}

TEST_F(ProcessRunnerTest, EnvironmentTest) {
    auto opt = shell("echo $ATST_VALUE");
    opt.env["ATST_VALUE"] = "42";
    auto result = run_process(opt);
    EXPECT_EQ(result.out, "42\n");
}

TEST_F(ProcessRunnerTest, MissingExecutableTest) {
    run_options opt;
    opt.command = {"atst-no-such-program"};
    opt.timeout = chrono::milliseconds(1000);
    opt.stream_size = 1024;
    EXPECT_THROW(run_process(opt), spawn_error);

    opt.command = {"/nonexistent/program"};
    EXPECT_THROW(run_process(opt), spawn_error);
}
