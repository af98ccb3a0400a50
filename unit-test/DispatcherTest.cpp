#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "judge/dispatcher.hpp"
#include "sandbox/process.hpp"
#include "test/assertions.hpp"
#include "test/environment.hpp"
#include "test/fake_runtime.hpp"
#include "test/shell_adapter.hpp"

using namespace std;
using namespace codejudge;
using namespace nlohmann;
namespace fs = std::filesystem;

static const char *ADD_PASSES = R"(echo '[{"passed":true,"expected":5,"actual":5,"description":"case 1","executionTimeMs":0.1}]')";
static const char *ADD_RETURNS_FOUR = R"(echo '[{"passed":false,"expected":5,"actual":4,"description":"case 1","executionTimeMs":0.1}]')";

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_test_run_dir("dispatcher");
        config = make_test_config(run_dir);
        pool = make_unique<worker_pool>(config.workers);
    }

    void TearDown() override {
        // 任何评测都不能遗留评测文件夹或者占用槽位
        EXPECT_EQ(count_entries_in_directory(run_dir), 0);
        EXPECT_EQ(pool->available(), pool->capacity());
    }

    unique_ptr<dispatcher> make_dispatcher() {
        return make_unique<dispatcher>(config, *pool, make_shell_adapters(config), make_unique<strategy_selector>(config));
    }

    fs::path run_dir;
    engine_config config;
    unique_ptr<worker_pool> pool;
};

TEST_F(DispatcherTest, PassingSubmissionTest) {
    auto submit = make_submission(ADD_PASSES, {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::COMPLETED);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_TRUE(report.results[0].passed);
    EXPECT_JSON_EQ(*report.results[0].actual, json(5));
    EXPECT_TRUE(report.success());
    EXPECT_GT(report.total_time_ms, 0);
}

TEST_F(DispatcherTest, WrongAnswerIsStillCompletedTest) {
    auto submit = make_submission(ADD_RETURNS_FOUR, {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::COMPLETED);
    ASSERT_EQ(report.results.size(), 1u);
    EXPECT_FALSE(report.results[0].passed);
    EXPECT_JSON_EQ(*report.results[0].actual, json(4));
    EXPECT_JSON_EQ(report.results[0].expected, json(5));
    EXPECT_FALSE(report.success());
}

TEST_F(DispatcherTest, InfiniteLoopTimesOutTest) {
    auto submit = make_submission("while :; do :; done", {2, 3}, 5, "add", 500);
    elapsed_time timer;
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::TIMEOUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 500 + config.grace_ms + 1000);
    for (auto &r : report.results) {
        EXPECT_FALSE(r.passed);
        EXPECT_FALSE(r.actual);
        EXPECT_CONTAINS(*r.error, "500ms");
    }
}

TEST_F(DispatcherTest, MissingResultsIsSandboxErrorTest) {
    auto submit = make_submission(R"(echo '[{"passed":true},{"passed":true}]')", {2, 3}, 5);
    submit.test_cases.push_back({json::array({1, 1}), 2, "case 2"});
    submit.test_cases.push_back({json::array({0, 0}), 0, "case 3"});
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::SANDBOX_ERROR);
    ASSERT_EQ(report.results.size(), 3u);
    for (auto &r : report.results) {
        EXPECT_FALSE(r.passed);
        EXPECT_EQ(*r.error, "Internal execution error");
    }
}

TEST_F(DispatcherTest, CompileErrorTest) {
    auto submit = make_submission("echo 'run.sh: 3: Syntax error: \"fi\" unexpected (syntax error)' >&2; exit 2", {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::COMPILE_ERROR);
    EXPECT_CONTAINS(*report.results[0].error, "unexpected");
    EXPECT_FALSE(report.results[0].actual);
}

TEST_F(DispatcherTest, RuntimeErrorTest) {
    auto submit = make_submission("echo 'TypeError: cannot read property' >&2; exit 3", {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::RUNTIME_ERROR);
    EXPECT_CONTAINS(*report.results[0].error, "TypeError: cannot read property");
    EXPECT_FALSE(report.results[0].actual);
}

TEST_F(DispatcherTest, StrayOutputIsToleratedTest) {
    auto submit = make_submission(string("echo 'debug: computing'\n") + ADD_PASSES, {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::COMPLETED);
    EXPECT_TRUE(report.results[0].passed);
}

TEST_F(DispatcherTest, HugeStrayOutputKeepsHarnessLineTest) {
    auto submit = make_submission(string("head -c 2000000 /dev/zero | tr '\\0' x\necho\n") + ADD_PASSES, {2, 3}, 5, "add", 10000);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::COMPLETED);
    EXPECT_TRUE(report.results[0].passed);
}

TEST_F(DispatcherTest, BackgroundProcessDoesNotOutliveRunTest) {
    auto submit = make_submission(R"(sleep 30 &
echo "[{\"passed\":true,\"actual\":$!}]")", {2, 3}, 5);
    auto report = make_dispatcher()->execute(submit);
    ASSERT_EQ(report.result, outcome::COMPLETED);
    pid_t background = report.results[0].actual->get<pid_t>();
    for (int i = 0; i < 50 && is_process_alive(background); ++i)
        this_thread::sleep_for(chrono::milliseconds(20));
    EXPECT_FALSE(is_process_alive(background));
}

TEST_F(DispatcherTest, InvalidSubmissionTest) {
    auto d = make_dispatcher();
    auto no_tests = make_submission(ADD_PASSES, {2, 3}, 5);
    no_tests.test_cases.clear();
    EXPECT_THROW(d->execute(no_tests), invalid_submission);

    EXPECT_THROW(d->execute(make_submission(ADD_PASSES, {2, 3}, 5, "add(); evil")), invalid_submission);
    EXPECT_THROW(d->execute(make_submission(ADD_PASSES, {2, 3}, 5, "add", config.max_time_limit_ms + 1)), invalid_submission);
    EXPECT_THROW(d->execute(make_submission(ADD_PASSES, {2, 3}, 5, "add", 0)), invalid_submission);

    auto huge_memory = make_submission(ADD_PASSES, {2, 3}, 5);
    huge_memory.memory_limit_mb = config.max_memory_limit_mb + 1;
    EXPECT_THROW(d->execute(huge_memory), invalid_submission);

    auto unsupported = make_submission(ADD_PASSES, {2, 3}, 5);
    unsupported.lang = language::GO;  // 测试用的适配器表里只有一个语言
    EXPECT_THROW(d->execute(unsupported), invalid_submission);
}

TEST_F(DispatcherTest, OverloadedTest) {
    config.queue_timeout_ms = 100;
    auto d = make_dispatcher();
    auto first = pool->acquire(chrono::milliseconds(10));
    auto second = pool->acquire(chrono::milliseconds(10));
    EXPECT_THROW(d->execute(make_submission(ADD_PASSES, {2, 3}, 5)), overloaded);
}

TEST_F(DispatcherTest, RunnerFailureIsSandboxErrorTest) {
    config.timeout_command = "/nonexistent/timeout";
    config.container_runtime = "/nonexistent/docker";
    auto report = make_dispatcher()->execute(make_submission(ADD_PASSES, {2, 3}, 5));
    EXPECT_EQ(report.result, outcome::SANDBOX_ERROR);
    EXPECT_EQ(*report.results[0].error, "Internal execution error");
}

TEST_F(DispatcherTest, SlowRunPastLimitIsTimeoutTest) {
    auto submit = make_submission(string("sleep 0.9\n") + ADD_PASSES, {2, 3}, 5, "add", 500);
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::TIMEOUT);
    EXPECT_FALSE(report.results[0].passed);
    EXPECT_CONTAINS(*report.results[0].error, "500ms");
}

TEST_F(DispatcherTest, TimeoutOverrideReplacesSubmissionLimitTest) {
    config.languages[language::TYPESCRIPT].native_timeout_ms = 300;
    auto submit = make_submission("sleep 30", {2, 3}, 5, "add", 10000);
    elapsed_time timer;
    auto report = make_dispatcher()->execute(submit);
    EXPECT_EQ(report.result, outcome::TIMEOUT);
    EXPECT_CONTAINS(*report.results[0].error, "300ms");
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}

TEST_F(DispatcherTest, ConcurrentSubmissionsRestorePoolTest) {
    config.queue_timeout_ms = 20000;
    auto d = make_dispatcher();
    atomic<int> completed{0};
    vector<thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]() {
            auto report = d->execute(make_submission(string("sleep 0.1\n") + ADD_PASSES, {2, 3}, 5));
            if (report.result == outcome::COMPLETED && report.results[0].passed) ++completed;
        });
    }
    for (auto &th : threads) th.join();
    EXPECT_EQ(completed.load(), 6);
}

class SandboxedDispatcherTest : public DispatcherTest {
protected:
    void SetUp() override {
        DispatcherTest::SetUp();
        runtime = make_unique<fake_runtime>(make_test_run_dir("dispatcher-runtime"));
        config.container_runtime = runtime->path();
        set_all_strategies(config, runner_strategy::SANDBOXED);
    }

    unique_ptr<fake_runtime> runtime;
};

TEST_F(SandboxedDispatcherTest, ContainerRunTest) {
    runtime->set_output(R"([{"passed":true,"expected":5,"actual":5}])");
    auto report = make_dispatcher()->execute(make_submission("unused", {2, 3}, 5));
    EXPECT_EQ(report.result, outcome::COMPLETED);
    EXPECT_TRUE(report.results[0].passed);
    EXPECT_EQ(runtime->count_calls("run "), 1);
    EXPECT_EQ(runtime->count_calls("rm -f codejudge-"), 1);
}

TEST_F(SandboxedDispatcherTest, HungContainerIsKilledTest) {
    runtime->set_sleep(30);
    config.grace_ms = 300;
    elapsed_time timer;
    auto report = make_dispatcher()->execute(make_submission("unused", {2, 3}, 5, "add", 300));
    EXPECT_EQ(report.result, outcome::TIMEOUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_EQ(runtime->count_calls("kill codejudge-"), 1);
    EXPECT_EQ(runtime->count_calls("rm -f codejudge-"), 1);
}

TEST_F(SandboxedDispatcherTest, TeardownFailureIsSandboxErrorTest) {
    runtime->set_output(R"([{"passed":true}])");
    runtime->fail_removal();
    auto report = make_dispatcher()->execute(make_submission("unused", {2, 3}, 5));
    EXPECT_EQ(report.result, outcome::SANDBOX_ERROR);
}

TEST_F(SandboxedDispatcherTest, MissingRuntimeIsSandboxErrorTest) {
    config.container_runtime = "/nonexistent/docker";
    auto report = make_dispatcher()->execute(make_submission("unused", {2, 3}, 5));
    EXPECT_EQ(report.result, outcome::SANDBOX_ERROR);
}

TEST_F(SandboxedDispatcherTest, NativeWithoutToolchainFallsBackToContainerTest) {
    runtime->set_output(R"([{"passed":true}])");
    config.languages[language::TYPESCRIPT].strategy = runner_strategy::NATIVE;
    config.timeout_command = "/nonexistent/timeout";  // 宿主机无法直接运行
    auto report = make_dispatcher()->execute(make_submission("unused", {2, 3}, 5));
    EXPECT_EQ(report.result, outcome::COMPLETED);
    EXPECT_EQ(runtime->count_calls("run "), 1);
}
