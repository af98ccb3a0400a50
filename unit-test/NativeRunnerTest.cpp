#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "test/assertions.hpp"
#include "sandbox/native_runner.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;
namespace fs = std::filesystem;

class NativeRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        run_dir = make_test_run_dir("native-runner");
        config = make_test_config(run_dir);
    }

    runnable_artifact script_artifact(execution_context &ctx, const string &script) {
        write_file_content(ctx.artifact_dir() / "run.sh", script);
        runnable_artifact artifact;
        artifact.dir = ctx.artifact_dir();
        artifact.command = make_command("/bin/sh", "run.sh");
        artifact.env = {{"SCRATCH_DIR", "${SCRATCH}"}};
        artifact.toolchain = "sh";
        return artifact;
    }

    chrono::steady_clock::time_point deadline(int ms) {
        return chrono::steady_clock::now() + chrono::milliseconds(ms);
    }

    fs::path run_dir;
    engine_config config;
};

TEST_F(NativeRunnerTest, RunsInArtifactDirectoryTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "pwd; echo \"$SCRATCH_DIR\"; test -d \"$SCRATCH_DIR\" && echo writable");
    resource_limits limits;
    limits.time_limit_ms = 2000;
    auto output = runner.run(ctx, artifact, limits, deadline(5000));
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_FALSE(output.timed_out);
    EXPECT_CONTAINS(output.stdout_text, artifact.dir.string());
    EXPECT_CONTAINS(output.stdout_text, ".scratch");
    EXPECT_CONTAINS(output.stdout_text, "writable");
    EXPECT_TRUE(ctx.torn_down());
    EXPECT_EQ(count_entries_in_directory(run_dir), 0);
}

TEST_F(NativeRunnerTest, ReportsExitCodeAndStderrTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "echo boom >&2; exit 4");
    auto output = runner.run(ctx, artifact, resource_limits(), deadline(5000));
    EXPECT_EQ(output.exit_code, 4);
    EXPECT_EQ(output.stderr_text, "boom\n");
    EXPECT_FALSE(output.timed_out);
}

TEST_F(NativeRunnerTest, InUnitTimeoutTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "while :; do :; done");
    resource_limits limits;
    limits.time_limit_ms = 500;
    elapsed_time timer;
    // 宿主机截止时间足够长，由沙箱内的 timeout 命令杀死
    auto output = runner.run(ctx, artifact, limits, deadline(10000));
    EXPECT_TRUE(output.timed_out);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
    EXPECT_EQ(count_entries_in_directory(run_dir), 0);
}

TEST_F(NativeRunnerTest, HostDeadlineTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "sleep 30");
    resource_limits limits;
    limits.time_limit_ms = 20000;
    elapsed_time timer;
    auto output = runner.run(ctx, artifact, limits, deadline(300));
    EXPECT_TRUE(output.timed_out);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 5000);
}

TEST_F(NativeRunnerTest, OutputLimitTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "head -c 5000 /dev/zero");
    resource_limits limits;
    limits.output_limit = 1000;
    auto output = runner.run(ctx, artifact, limits, deadline(5000));
    EXPECT_EQ(output.stdout_text.size(), 1000u);
}

TEST_F(NativeRunnerTest, MissingTimeoutCommandTearsDownTest) {
    config.timeout_command = "/nonexistent/timeout";
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "echo hi");
    EXPECT_FALSE(runner.is_available(artifact));
    EXPECT_THROW(runner.run(ctx, artifact, resource_limits(), deadline(5000)), system_error);
    EXPECT_TRUE(ctx.torn_down());
    EXPECT_EQ(count_entries_in_directory(run_dir), 0);
}

TEST_F(NativeRunnerTest, MissingToolchainIsSandboxErrorTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    runnable_artifact artifact;
    artifact.dir = ctx.artifact_dir();
    artifact.command = make_command("codejudge-missing-toolchain", "main.go");
    artifact.toolchain = "codejudge-missing-toolchain";
    EXPECT_FALSE(runner.is_available(artifact));
    EXPECT_THROW(runner.run(ctx, artifact, resource_limits(), deadline(5000)), sandbox_error);
    EXPECT_EQ(count_entries_in_directory(run_dir), 0);
}

TEST_F(NativeRunnerTest, AvailabilityTest) {
    native_runner runner(config);
    runnable_artifact artifact;
    artifact.toolchain = "sh";
    EXPECT_TRUE(runner.is_available(artifact));
    EXPECT_EQ(runner.strategy(), runner_strategy::NATIVE);
}

TEST_F(NativeRunnerTest, FractionalTimeLimitTest) {
    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "sleep 0.9; echo '[{\"passed\":true}]'");
    resource_limits limits;
    limits.time_limit_ms = 500;
    auto output = runner.run(ctx, artifact, limits, deadline(10000));
    // 时间限制不会被向上取整到整秒
    EXPECT_TRUE(output.timed_out);
    EXPECT_EQ(output.exit_code, 137);
    EXPECT_EQ(output.stdout_text, "");
}

TEST_F(NativeRunnerTest, OverrunWithoutKillIsTimeoutTest) {
    // 这个 timeout 命令不会杀死评测程序，只剩下运行时间可以判断超时
    fs::path bin = make_test_run_dir("native-runner-bin");
    write_file_content(bin / "lenient-timeout", "#!/bin/sh\nshift 3\nexec \"$@\"\n");
    fs::permissions(bin / "lenient-timeout", fs::perms::owner_all);
    config.timeout_command = (bin / "lenient-timeout").string();

    native_runner runner(config);
    execution_context ctx(run_dir);
    auto artifact = script_artifact(ctx, "sleep 0.9; echo '[{\"passed\":true}]'");
    resource_limits limits;
    limits.time_limit_ms = 500;
    auto output = runner.run(ctx, artifact, limits, deadline(10000));
    EXPECT_EQ(output.exit_code, 0);
    EXPECT_GE(output.wall_time_ms, 900);
    EXPECT_TRUE(output.timed_out);
}
