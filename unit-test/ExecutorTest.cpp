#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/executor.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace pysandbox;

class ExecutorTest : public ::testing::Test {
protected:
    ExecutorTest() : exec(test::make_test_config()) {}

    void TearDown() override {
        EXPECT_EQ(test::count_scratch_dirs(), 0u);
    }

    execution_result run(const string &source, const execution_limits &limits = {},
                         optional<string> stdin_data = nullopt) {
        return exec.execute({source, move(stdin_data), limits});
    }

    sandbox_executor exec;
};

/**
 * @brief is pid still running, waiting up to a second for it to go away
 * A zombie counts as gone: it may have been reparented to this process.
 */
static bool process_alive(pid_t pid) {
    for (int attempt = 0; attempt < 50; ++attempt) {
        if (waitpid(pid, nullptr, WNOHANG) == pid) return false;

        ifstream stat("/proc/" + to_string(pid) + "/stat");
        string content;
        if (!getline(stat, content)) return false;
        size_t state = content.rfind(')');
        if (state == string::npos || state + 2 >= content.size() || content[state + 2] == 'Z') return false;

        this_thread::sleep_for(chrono::milliseconds(20));
    }
    return true;
}

// forks a child that tries to leave the process group, then records both pids
static const char *forking_source =
    "import os, time\n"
    "path = input()\n"
    "pid = os.fork()\n"
    "if pid == 0:\n"
    "    try:\n"
    "        os.setsid()\n"
    "    except OSError:\n"
    "        pass\n"
    "    time.sleep(30)\n"
    "    os._exit(0)\n"
    "with open(path + '.tmp', 'w') as f:\n"
    "    f.write('%d %d' % (os.getpid(), pid))\n"
    "os.rename(path + '.tmp', path)\n";

class ForkingProgramTest : public ExecutorTest {
protected:
    void TearDown() override {
        filesystem::remove(pid_file);
        ExecutorTest::TearDown();
    }

    vector<pid_t> recorded_pids() const {
        ifstream in(pid_file);
        vector<pid_t> pids;
        pid_t pid;
        while (in >> pid) pids.push_back(pid);
        return pids;
    }

    execution_limits limits() const {
        execution_limits limits;
        limits.max_processes = 16;
        limits.cpu_time_seconds = 1;
        limits.wall_clock_seconds = 1;
        return limits;
    }

    filesystem::path pid_file =
        filesystem::temp_directory_path() / ("pysandbox-test-pids-" + to_string(getpid()));
};

TEST_F(ExecutorTest, HelloWorldTest) {
    auto result = run("print(\"hello\")\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "hello\n");
    EXPECT_EQ(result.stderr_data, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.signal);
    EXPECT_FALSE(result.truncated_stdout);
    EXPECT_GT(result.duration_ms, 0);
}

TEST_F(ExecutorTest, StdinTest) {
    auto result = run("a, b = map(int, input().split())\nprint(a + b)\n", {}, "2 3\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "5\n");
}

TEST_F(ExecutorTest, NoStdinTest) {
    auto result = run("try:\n    input()\nexcept EOFError:\n    print('eof')\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "eof\n");
}

TEST_F(ExecutorTest, BusyLoopTimesOutTest) {
    execution_limits limits;
    limits.cpu_time_seconds = 1;
    limits.wall_clock_seconds = 1;

    auto begin = chrono::steady_clock::now();
    auto result = run("while True:\n    pass\n", limits);
    auto elapsed = chrono::steady_clock::now() - begin;

    EXPECT_EQ(result.outcome, outcome::TIMED_OUT);
    EXPECT_FALSE(result.exit_code);
    EXPECT_LT(elapsed, chrono::seconds(3));
}

TEST_F(ExecutorTest, SleepTimesOutTest) {
    execution_limits limits;
    limits.wall_clock_seconds = 1;

    auto result = run("import time\nprint('start', flush=True)\ntime.sleep(10)\n", limits);
    EXPECT_EQ(result.outcome, outcome::TIMED_OUT);
    EXPECT_EQ(result.stdout_data, "start\n");
    EXPECT_LT(result.duration_ms, 3000);
}

TEST_F(ExecutorTest, MemoryExhaustionTest) {
    auto result = run("x = bytearray(200 * 1024 * 1024)\nprint(len(x))\n");
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_NE(result.stderr_data.find("MemoryError"), string::npos);
    EXPECT_EQ(result.stdout_data, "");
}

TEST_F(ExecutorTest, MemoryGrowthInLoopTest) {
    auto result = run("x = []\nwhile True:\n    x.append(' ' * 1000000)\n");
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.stdout_data, "");
}

TEST_F(ExecutorTest, MemoryExhaustionAfterStderrCapTest) {
    auto result = run(
        "import logging\n"
        "for i in range(300):\n"
        "    logging.warning('message %d %s', i, 'x' * 100)\n"
        "x = []\n"
        "while True:\n"
        "    x.append(' ' * 1000000)\n");
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_TRUE(result.truncated_stderr);
    EXPECT_EQ(result.stderr_data.size(), (size_t)execution_limits{}.max_output_bytes);
    EXPECT_EQ(result.stderr_data.find("MemoryError"), string::npos);
}

TEST_F(ExecutorTest, SegmentationFaultTest) {
    execution_limits limits;
    limits.max_memory_bytes = 256 * 1024 * 1024;

    auto result = run("import ctypes\nctypes.string_at(0)\n", limits);
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_EQ(result.signal, SIGSEGV);
}

TEST_F(ExecutorTest, OpenFilesExhaustionTest) {
    auto result = run("files = [open('f%d' % i, 'w') for i in range(100)]\n");
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_NE(result.stderr_data.find("[Errno 24]"), string::npos);
}

TEST_F(ExecutorTest, FileSizeExhaustionTest) {
    auto result = run("with open('big', 'w') as f:\n    f.write('x' * (2 * 1024 * 1024))\n");
    EXPECT_EQ(result.outcome, outcome::RESOURCE_EXCEEDED);
    EXPECT_NE(result.stderr_data.find("[Errno 27]"), string::npos);
}

TEST_F(ExecutorTest, ScratchFilesTest) {
    auto result = run("with open('data.txt', 'w') as f:\n    f.write('abc')\nprint(open('data.txt').read())\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "abc\n");
}

TEST_F(ExecutorTest, OutputTruncatedTest) {
    execution_limits limits;
    limits.max_output_bytes = 100;

    auto result = run("print('x' * 500, end='')\n", limits);
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, string(100, 'x'));
    EXPECT_TRUE(result.truncated_stdout);
    EXPECT_FALSE(result.truncated_stderr);
}

TEST_F(ExecutorTest, OutputAtCapNotTruncatedTest) {
    execution_limits limits;
    limits.max_output_bytes = 100;

    auto result = run("print('x' * 100, end='')\n", limits);
    EXPECT_EQ(result.stdout_data, string(100, 'x'));
    EXPECT_FALSE(result.truncated_stdout);
}

TEST_F(ExecutorTest, StderrTruncatedTest) {
    execution_limits limits;
    limits.max_output_bytes = 64;

    auto result = run("import sys\nsys.stderr.write('e' * 1000)\nprint('ok')\n", limits);
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "ok\n");
    EXPECT_EQ(result.stderr_data.size(), 64u);
    EXPECT_TRUE(result.truncated_stderr);
}

TEST_F(ExecutorTest, RuntimeFailureTest) {
    auto result = run("print('before')\nprint(1 / 0)\n");
    EXPECT_EQ(result.outcome, outcome::RUNTIME_FAILURE);
    EXPECT_EQ(result.stdout_data, "before\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), string::npos);
}

TEST_F(ExecutorTest, ExitCodeTest) {
    auto result = run("raise SystemExit(3)\n");
    EXPECT_EQ(result.outcome, outcome::RUNTIME_FAILURE);
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(ExecutorTest, KilledBySignalTest) {
    auto result = run("import signal\nsignal.raise_signal(signal.SIGTERM)\n");
    EXPECT_EQ(result.outcome, outcome::RUNTIME_FAILURE);
    EXPECT_EQ(result.signal, SIGTERM);
    EXPECT_EQ(result.exit_code, 128 + SIGTERM);
}

TEST_F(ExecutorTest, HostEnvironmentHiddenTest) {
    setenv("PYSANDBOX_TEST_SECRET", "s3cret", 1);
    auto result = run("import os\nprint(os.environ.get('PYSANDBOX_TEST_SECRET'))\nprint(os.environ['PYTHONHASHSEED'])\n");
    unsetenv("PYSANDBOX_TEST_SECRET");

    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "None\n0\n");
}

TEST_F(ExecutorTest, NetworkDeniedTest) {
    auto result = run(
        "import socket\n"
        "try:\n"
        "    socket.socket(socket.AF_INET, socket.SOCK_STREAM)\n"
        "    print('connected')\n"
        "except PermissionError:\n"
        "    print('denied')\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "denied\n");
}

TEST_F(ExecutorTest, KillOutsideProcessGroupDeniedTest) {
    auto result = run(
        "import os, signal\n"
        "try:\n"
        "    os.kill(-1, signal.SIGCONT)\n"
        "except PermissionError:\n"
        "    print('denied')\n");
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "denied\n");
}

TEST_F(ExecutorTest, InvalidLimitsTest) {
    execution_limits limits;
    limits.cpu_time_seconds = 0;
    EXPECT_THROW(run("print(1)\n", limits), invalid_argument);

    limits = {};
    limits.wall_clock_seconds = numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(run("print(1)\n", limits), invalid_argument);

    limits = {};
    limits.max_memory_bytes = -1;
    EXPECT_THROW(run("print(1)\n", limits), invalid_argument);
}

TEST_F(ExecutorTest, LimitsClampedToCeilingTest) {
    execution_limits limits;
    limits.wall_clock_seconds = 1e6;
    limits.cpu_time_seconds = 1e6;

    auto result = run("print(1)\n", limits);
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
}

TEST_F(ExecutorTest, CancellationTest) {
    execution_limits limits;
    limits.cpu_time_seconds = 20;
    limits.wall_clock_seconds = 20;

    cancellation_token token;
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(300));
        token.cancel();
    });

    auto begin = chrono::steady_clock::now();
    EXPECT_THROW(exec.execute({"import time\ntime.sleep(20)\n", nullopt, limits}, &token), execution_cancelled);
    auto elapsed = chrono::steady_clock::now() - begin;
    canceller.join();

    EXPECT_LT(elapsed, chrono::seconds(3));
}

TEST_F(ExecutorTest, CancelledBeforeStartTest) {
    cancellation_token token;
    token.cancel();
    EXPECT_THROW(exec.execute({"print(1)\n", nullopt, {}}, &token), execution_cancelled);
}

TEST_F(ExecutorTest, MissingInterpreterTest) {
    auto config = exec.config();
    config.python_executable = "/nonexistent/python3";
    sandbox_executor broken(config);

    auto result = broken.execute({"print(1)\n", nullopt, {}});
    EXPECT_EQ(result.outcome, outcome::SANDBOX_ERROR);
    EXPECT_FALSE(result.internal_error.empty());
    EXPECT_FALSE(result.exit_code);
}

TEST_F(ExecutorTest, ConcurrentExecutionTest) {
    vector<execution_result> results(4);
    vector<thread> threads;
    for (size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i] {
            results[i] = exec.execute({"print(int(input()) * 2)\n", to_string(i), {}});
        });
    for (auto &thd : threads) thd.join();

    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].outcome, outcome::COMPLETED);
        EXPECT_EQ(results[i].stdout_data, to_string(i * 2) + "\n");
    }
}

TEST_F(ExecutorTest, LeavingProcessGroupDeniedTest) {
    execution_limits limits;
    limits.max_processes = 16;

    auto result = run(
        "import os\n"
        "pid = os.fork()\n"
        "if pid == 0:\n"
        "    codes = []\n"
        "    for call in (os.setsid, lambda: os.setpgid(0, 0)):\n"
        "        try:\n"
        "            call()\n"
        "            codes.append(0)\n"
        "        except OSError as e:\n"
        "            codes.append(e.errno)\n"
        "    print(*codes, flush=True)\n"
        "    os._exit(0)\n"
        "os.waitpid(pid, 0)\n",
        limits);
    EXPECT_EQ(result.outcome, outcome::COMPLETED);
    EXPECT_EQ(result.stdout_data, "13 13\n");
}

TEST_F(ForkingProgramTest, NoProcessSurvivesTimeoutTest) {
    auto result = run(string(forking_source) + "while True:\n    pass\n", limits(), pid_file.string() + "\n");
    EXPECT_EQ(result.outcome, outcome::TIMED_OUT);

    auto pids = recorded_pids();
    ASSERT_EQ(pids.size(), 2u) << result.stderr_data;
    for (pid_t pid : pids) EXPECT_FALSE(process_alive(pid)) << "pid " << pid;
}

TEST_F(ForkingProgramTest, NoProcessSurvivesCancellationTest) {
    auto relaxed = limits();
    relaxed.cpu_time_seconds = 20;
    relaxed.wall_clock_seconds = 20;

    cancellation_token token;
    thread canceller([&] {
        for (int i = 0; i < 150 && !filesystem::exists(pid_file); ++i)
            this_thread::sleep_for(chrono::milliseconds(20));
        token.cancel();
    });

    execution_request request{string(forking_source) + "time.sleep(20)\n", pid_file.string() + "\n", relaxed};
    EXPECT_THROW(exec.execute(request, &token), execution_cancelled);
    canceller.join();

    auto pids = recorded_pids();
    ASSERT_EQ(pids.size(), 2u);
    for (pid_t pid : pids) EXPECT_FALSE(process_alive(pid)) << "pid " << pid;
}

