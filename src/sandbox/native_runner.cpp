#include "sandbox/native_runner.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/process.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

native_runner::native_runner(const engine_config &config) {
    timeout_command = config.timeout_command;
}

runner_strategy native_runner::strategy() const {
    return runner_strategy::NATIVE;
}

bool native_runner::is_available(const runnable_artifact &artifact) const {
    if (find_executable(timeout_command).empty()) return false;
    return artifact.toolchain.empty() || !find_executable(artifact.toolchain).empty();
}

raw_execution_output native_runner::execute(execution_context &ctx, const runnable_artifact &artifact,
                                            const resource_limits &limits, chrono::steady_clock::time_point deadline) {
    fs::path scratch = artifact.dir / ".scratch";
    fs::create_directories(scratch);

    process_options options;
    options.argv = timeout_prefix(limits);
    options.argv.insert(options.argv.end(), artifact.command.begin(), artifact.command.end());
    options.env = expand_scratch(artifact.env, scratch.string());
    options.env["TMPDIR"] = scratch.string();
    options.work_dir = artifact.dir;
    options.deadline = deadline;
    options.output_limit = limits.output_limit;
    options.cpu_limit_seconds = (int)ceil(limits.time_limit_ms / 1000.0) + 1;

    LOG(INFO) << "Running " << artifact.command.front() << " natively for execution context " << ctx.id();
    process_result result = run_process(options);

    if (!result.timed_out && (result.exitcode == 126 || result.exitcode == 127))
        throw sandbox_error("Unable to start " + artifact.command.front() + " (exit code " + to_string(result.exitcode) + "): " + result.stderr_text);

    raw_execution_output output;
    output.stdout_text = move(result.stdout_text);
    output.stderr_text = move(result.stderr_text);
    output.exit_code = result.exitcode;
    output.wall_time_ms = result.wall_time_ms;
    // 宿主机上的运行时间就是评测程序的运行时间，超过限制即为超时
    output.timed_out = result.timed_out || killed_by_timeout(result.exitcode, result.wall_time_ms, limits) ||
                       result.exitcode == 128 + SIGXCPU || result.wall_time_ms > limits.time_limit_ms;
    return output;
}

}  // namespace codejudge
