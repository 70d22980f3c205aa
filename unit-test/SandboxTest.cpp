#include <signal.h>
#include <stdlib.h>
#include <cerrno>
#include <thread>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/sandbox.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using namespace grader::test;

class SandboxTest : public ::testing::Test {
protected:
    temp_directory dir{"sandbox-test"};
    shared_ptr<const grader_config> config = make_shared<const grader_config>(test_config(dir.path / "run"));
    sandbox runner{config};
    workspace ws = make_workspace(dir.path / "run" / "grade_test", {{"main.py", "print('hello')\n"}, {"requirements.txt", ""}});
    cancellation_token token;

    execution_outcome run(const vector<string> &command, double timeout = 0) {
        sandbox_request request;
        request.command = command;
        request.limits = runner.default_limits(timeout);
        return runner.run(ws, request, token);
    }
};

TEST_F(SandboxTest, SuccessTest) {
    auto outcome = run({"sh", "-c", "echo hello; echo oops >&2"});
    EXPECT_EQ(outcome.exit_status, 0);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_FALSE(outcome.timed_out());
    EXPECT_FALSE(outcome.truncated);
    EXPECT_EQ(outcome.stdout_text, "hello\n");
    EXPECT_EQ(outcome.stderr_text, "oops\n");
}

TEST_F(SandboxTest, NonZeroExitTest) {
    execution_outcome outcome;
    ASSERT_NO_THROW(outcome = run({"sh", "-c", "exit 3"}));
    EXPECT_EQ(outcome.exit_status, 3);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_FALSE(outcome.timed_out());
}

TEST_F(SandboxTest, CommandNotFoundTest) {
    execution_outcome outcome;
    ASSERT_NO_THROW(outcome = run({"/nonexistent/program"}));
    EXPECT_NE(outcome.exit_status, 0);
    EXPECT_FALSE(outcome.succeeded());
}

TEST_F(SandboxTest, TimeoutTest) {
    auto outcome = run({"sh", "-c", "sleep 30"}, 1);
    EXPECT_TRUE(outcome.timeout);
    EXPECT_TRUE(outcome.timed_out());
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_LT(outcome.wall_time, 5);
}

TEST_F(SandboxTest, TimeoutKillsProcessTreeTest) {
    // 后台进程持有输出管道，超时后必须被一起杀死，否则 runguard 无法退出
    elapsed_time timer;
    auto outcome = run({"sh", "-c", "sleep 30 & sleep 30 & wait"}, 1);
    EXPECT_TRUE(outcome.timeout);
    EXPECT_LT(timer.seconds(), 8);
}

TEST_F(SandboxTest, OutputTruncationTest) {
    auto outcome = run({"sh", "-c", "head -c 100000 /dev/zero | tr '\\0' a"});
    EXPECT_EQ(outcome.exit_status, 0);
    EXPECT_TRUE(outcome.truncated);
    EXPECT_NE(outcome.stdout_text.find("[output truncated]"), string::npos);
    EXPECT_LE(outcome.stdout_text.size(), config->sandbox_output_limit + 64);
}

TEST_F(SandboxTest, EnvironmentIsolationTest) {
    setenv("GRADER_TEST_SECRET", "leaked", 1);
    auto outcome = run({"sh", "-c", "echo \"[$GRADER_TEST_SECRET]\""});
    unsetenv("GRADER_TEST_SECRET");
    EXPECT_EQ(outcome.stdout_text, "[]\n");
}

TEST_F(SandboxTest, RequestEnvironmentTest) {
    sandbox_request request;
    request.command = {"sh", "-c", "echo $LANGUAGE_NAME $ENTRY"};
    request.limits = runner.default_limits();
    request.environment = {{"LANGUAGE_NAME", "${language}"}, {"ENTRY", "${entry_point}"}};
    auto outcome = runner.run(ws, request, token);
    EXPECT_EQ(outcome.stdout_text, "python main.py\n");
}

TEST_F(SandboxTest, WritableCopyTest) {
    auto outcome = run({"sh", "-c", "echo changed > main.py && cat main.py"});
    EXPECT_EQ(outcome.exit_status, 0);
    EXPECT_EQ(outcome.stdout_text, "changed\n");
    EXPECT_EQ(read_file_content(ws.snapshot / "main.py"), "print('hello')\n");

    // 每次运行都使用新的副本
    auto second = run({"cat", "main.py"});
    EXPECT_EQ(second.stdout_text, "print('hello')\n");
}

TEST_F(SandboxTest, FixtureTest) {
    sandbox_request request;
    request.command = {"cat", "${fixture}/data/query.txt"};
    request.limits = runner.default_limits();
    request.fixtures.push_back(make_shared<text_asset>("data/query.txt", "What is RAG?"));
    auto outcome = runner.run(ws, request, token);
    EXPECT_EQ(outcome.exit_status, 0);
    EXPECT_EQ(outcome.stdout_text, "What is RAG?");
}

TEST_F(SandboxTest, RunDirectoryRemovedTest) {
    run({"true"});
    for (auto &entry : filesystem::directory_iterator(ws.root))
        EXPECT_EQ(entry.path().filename(), "snapshot");
}

TEST_F(SandboxTest, CancellationTest) {
    thread canceller([this] {
        this_thread::sleep_for(chrono::milliseconds(300));
        token.cancel();
    });
    elapsed_time timer;
    auto outcome = run({"sh", "-c", "sleep 30"}, 20);
    canceller.join();
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_LT(timer.seconds(), 10);
}

TEST_F(SandboxTest, CancelledBeforeStartTest) {
    // runguard 刚启动时就收到 SIGTERM，命令不能在沙箱返回后继续运行
    filesystem::path pid_file = dir.path / "command.pid";
    token.cancel();
    elapsed_time timer;
    auto outcome = run({"sh", "-c", "echo $$ > " + pid_file.string() + "; exec sleep 30"}, 20);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_LT(timer.seconds(), 10);

    this_thread::sleep_for(chrono::milliseconds(200));
    string pid = read_file_content(pid_file, "");
    if (!pid.empty()) {
        int alive = kill(stoi(pid), 0);
        int err = errno;
        EXPECT_NE(alive, 0);
        EXPECT_EQ(err, ESRCH);
    }
}

TEST_F(SandboxTest, CpuLimitTest) {
    sandbox_request request;
    request.command = {"sh", "-c", "while :; do :; done"};
    request.limits = runner.default_limits(10);
    request.limits.cpu_time = 1;
    elapsed_time timer;
    auto outcome = runner.run(ws, request, token);
    EXPECT_TRUE(outcome.cpu_limit_exceeded);
    EXPECT_FALSE(outcome.timeout);
    EXPECT_TRUE(outcome.timed_out());
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_LT(timer.seconds(), 8);
}

TEST_F(SandboxTest, MemoryLimitTest) {
    // 在 64MB 的地址空间中读入 200MB 的数据
    sandbox_request request;
    request.command = {"sh", "-c", "x=$(head -c 200000000 /dev/zero | tr '\\0' a); echo ${#x}"};
    request.limits = runner.default_limits(10);
    request.limits.memory = 65536;
    execution_outcome outcome;
    ASSERT_NO_THROW(outcome = runner.run(ws, request, token));
    EXPECT_NE(outcome.exit_status, 0);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.stdout_text.find("200000000"), string::npos);
}

TEST_F(SandboxTest, ProcessLimitWithoutRunUserTest) {
    // 没有设置运行用户时进程数限制会和评测程序自身共享，不能应用
    ASSERT_TRUE(config->run_user.empty());
    sandbox_request request;
    request.command = {"sh", "-c", "true | true | true; (echo done)"};
    request.limits = runner.default_limits();
    request.limits.nproc = 1;
    auto outcome = runner.run(ws, request, token);
    EXPECT_EQ(outcome.exit_status, 0);
    EXPECT_EQ(outcome.stdout_text, "done\n");
}

TEST_F(SandboxTest, MissingRunguardTest) {
    grader_config broken = test_config(dir.path / "run");
    broken.runguard = dir.path / "no-runguard";
    sandbox bad_runner(make_shared<const grader_config>(broken));
    sandbox_request request;
    request.command = {"true"};
    request.limits = bad_runner.default_limits();
    EXPECT_THROW(bad_runner.run(ws, request, token), sandbox_infrastructure_error);
}

TEST_F(SandboxTest, ExpandCommandTest) {
    language_profile profile;
    profile.install_command = {"pip", "install", "-r", "requirements.txt"};
    profile.run_command = {"python3", "${entry_point}"};
    auto command = expand_command({"sh", "${workspace}/run.sh", "${install_command}", "--", "${run_command}"},
                                  {{"workspace", "/tmp/work"}, {"entry_point", "app.py"}}, profile);
    vector<string> expected = {"sh", "/tmp/work/run.sh", "pip", "install", "-r", "requirements.txt", "--", "python3", "app.py"};
    EXPECT_EQ(command, expected);
}
