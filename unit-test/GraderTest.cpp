#include <stdexcept>
#include <thread>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/grader.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace pysandbox;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;

struct mock_executor : public executor {
    MOCK_METHOD(execution_result, execute, (const execution_request &, const cancellation_token *), (const, override));
};

static execution_result completed(const string &stdout_data) {
    execution_result result;
    result.outcome = outcome::COMPLETED;
    result.exit_code = 0;
    result.stdout_data = stdout_data;
    result.duration_ms = 10;
    return result;
}

static execution_result sandbox_failure() {
    execution_result result;
    result.outcome = outcome::SANDBOX_ERROR;
    result.internal_error = "fork: Resource temporarily unavailable";
    return result;
}

static test_case make_case(const string &input, const string &expected, double weight = 1.0, bool hidden = false) {
    test_case testcase;
    testcase.input = input;
    testcase.expected_output = expected;
    testcase.weight = weight;
    testcase.hidden = hidden;
    return testcase;
}

class GraderTest : public ::testing::Test {
protected:
    validator check{default_policy()};
    mock_executor exec;
    grader judge{check, exec, chrono::milliseconds(1)};
};

TEST_F(GraderTest, RejectedSubmissionNeverRunsTest) {
    EXPECT_CALL(exec, execute(_, _)).Times(0);

    auto submit = judge.grade("import os\nos.system(\"ls\")\n", {make_case("", "")}, {});
    EXPECT_EQ(submit.status, submission_status::ERRORED);
    EXPECT_EQ(submit.score, 0);
    EXPECT_EQ(submit.passed_count, 0u);
    EXPECT_EQ(submit.total_count, 1u);
    ASSERT_EQ(submit.test_results.size(), 1u);
    EXPECT_FALSE(submit.test_results[0].index);
    EXPECT_FALSE(submit.test_results[0].passed);
    EXPECT_EQ(submit.test_results[0].result.outcome, outcome::REJECTED);
    ASSERT_EQ(submit.test_results[0].result.violations.size(), 1u);
    EXPECT_EQ(submit.test_results[0].result.violations[0].kind, violation_kind::FORBIDDEN_IMPORT);
}

TEST_F(GraderTest, NoTestCasesTest) {
    EXPECT_CALL(exec, execute(_, _)).Times(0);

    auto submit = judge.grade("print(1)\n", {}, {});
    EXPECT_EQ(submit.status, submission_status::FAILED);
    EXPECT_EQ(submit.score, 0);
    EXPECT_TRUE(submit.test_results.empty());
}

TEST_F(GraderTest, CasesRunInOrderWithTheirInputTest) {
    ::testing::InSequence seq;
    EXPECT_CALL(exec, execute(Field(&execution_request::stdin_data, optional<string>("1")), _))
        .WillOnce(Return(completed("1\n")));
    EXPECT_CALL(exec, execute(Field(&execution_request::stdin_data, optional<string>("2")), _))
        .WillOnce(Return(completed("2\n")));

    auto submit = judge.grade("print(input())\n", {make_case("1", "1"), make_case("2", "2")}, {});
    EXPECT_EQ(submit.status, submission_status::PASSED);
    EXPECT_EQ(submit.score, 100);
    EXPECT_EQ(submit.passed_count, 2u);
    ASSERT_EQ(submit.test_results.size(), 2u);
    EXPECT_EQ(submit.test_results[0].index, 0u);
    EXPECT_EQ(submit.test_results[1].index, 1u);
    EXPECT_EQ(submit.duration_ms, 20);
}

TEST_F(GraderTest, WeightedScoreTest) {
    EXPECT_CALL(exec, execute(_, _))
        .WillOnce(Return(completed("right\n")))
        .WillOnce(Return(completed("wrong\n")));

    auto submit = judge.grade("print(input())\n", {make_case("a", "right", 3), make_case("b", "right", 1)}, {});
    EXPECT_EQ(submit.status, submission_status::FAILED);
    EXPECT_DOUBLE_EQ(submit.score, 75);
    EXPECT_EQ(submit.passed_count, 1u);
}

TEST_F(GraderTest, HiddenCasesScoredAlikeTest) {
    EXPECT_CALL(exec, execute(_, _))
        .WillOnce(Return(completed("x\n")))
        .WillOnce(Return(completed("y\n")));

    auto submit = judge.grade("print(input())\n", {make_case("", "x"), make_case("", "x", 1, true)}, {});
    EXPECT_DOUBLE_EQ(submit.score, 50);
    EXPECT_TRUE(submit.test_results[0].passed);
    EXPECT_FALSE(submit.test_results[1].passed);
}

TEST_F(GraderTest, OutputNormalizedBeforeComparisonTest) {
    EXPECT_CALL(exec, execute(_, _)).WillOnce(Return(completed("1 2  \r\n3\r\n\r\n")));

    auto submit = judge.grade("print(1)\n", {make_case("", "1 2\n3")}, {});
    EXPECT_EQ(submit.status, submission_status::PASSED);
}

TEST_F(GraderTest, OnlyCompletedCasesPassTest) {
    execution_result timed_out = completed("5\n");
    timed_out.outcome = outcome::TIMED_OUT;
    timed_out.exit_code.reset();
    EXPECT_CALL(exec, execute(_, _)).WillOnce(Return(timed_out));

    auto submit = judge.grade("print(5)\n", {make_case("", "5")}, {});
    EXPECT_EQ(submit.status, submission_status::FAILED);
    EXPECT_FALSE(submit.test_results[0].passed);
}

TEST_F(GraderTest, SandboxErrorRetriedOnceTest) {
    EXPECT_CALL(exec, execute(_, _))
        .WillOnce(Return(sandbox_failure()))
        .WillOnce(Return(completed("ok\n")));

    auto submit = judge.grade("print('ok')\n", {make_case("", "ok")}, {});
    EXPECT_EQ(submit.status, submission_status::PASSED);
    EXPECT_EQ(submit.test_results[0].result.outcome, outcome::COMPLETED);
}

TEST_F(GraderTest, PersistentSandboxErrorStopsGradingTest) {
    EXPECT_CALL(exec, execute(_, _))
        .WillOnce(Return(completed("ok\n")))
        .WillOnce(Return(sandbox_failure()))
        .WillOnce(Return(sandbox_failure()));

    auto submit = judge.grade("print('ok')\n", {make_case("", "ok"), make_case("", "ok"), make_case("", "ok")}, {});
    EXPECT_EQ(submit.status, submission_status::ERRORED);
    ASSERT_EQ(submit.test_results.size(), 2u);
    EXPECT_TRUE(submit.test_results[0].passed);
    EXPECT_EQ(submit.test_results[1].result.outcome, outcome::SANDBOX_ERROR);
    EXPECT_EQ(submit.total_count, 3u);
    EXPECT_NEAR(submit.score, 100.0 / 3, 1e-9);
}

TEST_F(GraderTest, CancelledDuringBackoffTest) {
    grader slow(check, exec, chrono::milliseconds(10000));
    cancellation_token token;
    EXPECT_CALL(exec, execute(_, _)).WillOnce(Return(sandbox_failure()));

    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(100));
        token.cancel();
    });
    EXPECT_THROW(slow.grade("print(1)\n", {make_case("", "1")}, {}, &token), execution_cancelled);
    canceller.join();
}

TEST_F(GraderTest, InvalidWeightTest) {
    EXPECT_CALL(exec, execute(_, _)).Times(0);
    EXPECT_THROW(judge.grade("print(1)\n", {make_case("", "1", 0)}, {}), invalid_argument);
    EXPECT_THROW(judge.grade("print(1)\n", {make_case("", "1", -2)}, {}), invalid_argument);
}

TEST_F(GraderTest, InvalidLimitsTest) {
    execution_limits limits;
    limits.max_open_files = 0;
    EXPECT_CALL(exec, execute(_, _)).Times(0);
    EXPECT_THROW(judge.grade("print(1)\n", {make_case("", "1")}, limits), invalid_argument);
}

TEST(NormalizeOutputTest, NormalizeTest) {
    EXPECT_EQ(normalize_output("5\n"), "5");
    EXPECT_EQ(normalize_output("5"), "5");
    EXPECT_EQ(normalize_output("a \t\r\nb  \n\n\n"), "a\nb");
    EXPECT_EQ(normalize_output("\n\nx"), "\n\nx");
    EXPECT_EQ(normalize_output("  leading"), "  leading");
    EXPECT_EQ(normalize_output(""), "");
    EXPECT_EQ(normalize_output("\n \n"), "");
    EXPECT_NE(normalize_output("a\n\nb"), normalize_output("a\nb"));
}

class GraderScenarioTest : public ::testing::Test {
protected:
    GraderScenarioTest() : exec(test::make_test_config()), judge(check, exec, chrono::milliseconds(10)) {}

    validator check{default_policy()};
    sandbox_executor exec;
    grader judge;
};

TEST_F(GraderScenarioTest, SumOfInputTest) {
    auto submit = judge.grade("print(sum(map(int, input().split())))\n", {make_case("2 3", "5")}, {});
    EXPECT_EQ(submit.status, submission_status::PASSED);
    EXPECT_EQ(submit.score, 100);
    ASSERT_EQ(submit.test_results.size(), 1u);
    EXPECT_TRUE(submit.test_results[0].passed);
    EXPECT_EQ(test::count_scratch_dirs(), 0u);
}

TEST_F(GraderScenarioTest, HalfPassedTest) {
    auto submit = judge.grade("print(int(input()) * 2)\n", {make_case("2", "4"), make_case("3", "7")}, {});
    EXPECT_EQ(submit.status, submission_status::FAILED);
    EXPECT_EQ(submit.score, 50);
    EXPECT_EQ(submit.passed_count, 1u);
}

TEST_F(GraderScenarioTest, ProgramErrorIsNotSandboxErrorTest) {
    auto submit = judge.grade("print(1 / 0)\n", {make_case("", "0")}, {});
    EXPECT_EQ(submit.status, submission_status::FAILED);
    ASSERT_EQ(submit.test_results.size(), 1u);
    auto &result = submit.test_results[0].result;
    EXPECT_EQ(result.outcome, outcome::RUNTIME_FAILURE);
    ASSERT_TRUE(result.exit_code);
    EXPECT_NE(*result.exit_code, 0);
    EXPECT_NE(result.stderr_data.find("ZeroDivisionError"), string::npos);
}

TEST_F(GraderScenarioTest, MissingInterpreterErroredTest) {
    auto config = exec.config();
    config.python_executable = "/nonexistent/python3";
    sandbox_executor broken(config);
    grader failing(check, broken, chrono::milliseconds(1));

    auto submit = failing.grade("print(1)\n", {make_case("", "1"), make_case("", "1")}, {});
    EXPECT_EQ(submit.status, submission_status::ERRORED);
    EXPECT_EQ(submit.test_results.size(), 1u);
    EXPECT_EQ(submit.score, 0);
}
