#include "sandbox/container_runner.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "sandbox/process.hpp"

namespace codejudge {
using namespace std;

container_runner::container_runner(const engine_config &config)
    : runtime(config.container_runtime), pids_limit(config.pids_limit), teardown_timeout_ms(max(config.grace_ms, 3000)) {
    timeout_command = config.timeout_command;
}

runner_strategy container_runner::strategy() const {
    return runner_strategy::SANDBOXED;
}

bool container_runner::is_available(const runnable_artifact &) const {
    return !find_executable(runtime).empty();
}

vector<string> container_runner::build_run_command(const string &unit_name, const runnable_artifact &artifact,
                                                   const resource_limits &limits) const {
    string memory = to_string(limits.memory_limit_mb) + "m";
    // clang-format off
    vector<string> argv = make_command(
        runtime, "run",
        "--name", unit_name,
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,  // 与 memory 相同表示禁用 swap
        "--cpu-period", 100000,
        "--cpu-quota", limits.cpu_quota,
        "--pids-limit", pids_limit,
        "--read-only",
        "--tmpfs", "/tmp:rw,exec,size=64m",
        "-v", artifact.dir.string() + ":/code:ro",
        "-w", "/code");
    // clang-format on

    for (auto &[key, value] : expand_scratch(artifact.env, "/tmp")) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }

    argv.push_back(artifact.image);
    for (auto &arg : timeout_prefix(limits)) argv.push_back(arg);
    argv.insert(argv.end(), artifact.command.begin(), artifact.command.end());
    return argv;
}

raw_execution_output container_runner::execute(execution_context &ctx, const runnable_artifact &artifact,
                                               const resource_limits &limits, chrono::steady_clock::time_point deadline) {
    string unit_name = ctx.unit_name();
    // 在创建容器之前注册，保证即使 docker run 中途失败，残留的容器也会被删除
    ctx.register_unit(unit_name, [this, unit_name]() { remove_unit(unit_name); });

    process_options options;
    options.argv = build_run_command(unit_name, artifact, limits);
    options.deadline = deadline;
    options.output_limit = limits.output_limit;

    LOG(INFO) << "Starting container " << unit_name << " from image " << artifact.image;
    process_result result = run_process(options);

    if (result.timed_out) {
        // 杀死 docker 客户端不会停止容器本身
        kill_unit(unit_name);
    } else if (result.exitcode == 125 || result.exitcode == 126 || result.exitcode == 127) {
        throw sandbox_error("Container " + unit_name + " failed to start (exit code " + to_string(result.exitcode) + "): " + result.stderr_text);
    }

    raw_execution_output output;
    output.stdout_text = move(result.stdout_text);
    output.stderr_text = move(result.stderr_text);
    output.exit_code = result.exitcode;
    output.wall_time_ms = result.wall_time_ms;
    output.timed_out = result.timed_out || killed_by_timeout(result.exitcode, result.wall_time_ms, limits);
    return output;
}

void container_runner::kill_unit(const string &unit_name) const {
    process_options options;
    options.argv = make_command(runtime, "kill", unit_name);
    options.deadline = chrono::steady_clock::now() + chrono::milliseconds(teardown_timeout_ms);
    try {
        process_result result = run_process(options);
        if (result.timed_out || result.exitcode != 0)
            LOG(WARNING) << "Unable to kill container " << unit_name << ": " << result.stderr_text;
        else
            LOG(INFO) << "Killed container " << unit_name;
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to kill container " << unit_name << ": " << e.what();
    }
}

void container_runner::remove_unit(const string &unit_name) const {
    process_options options;
    options.argv = make_command(runtime, "rm", "-f", unit_name);
    options.deadline = chrono::steady_clock::now() + chrono::milliseconds(teardown_timeout_ms);
    process_result result = run_process(options);
    if (result.timed_out)
        throw sandbox_error("Removing container " + unit_name + " timed out");
    if (result.exitcode != 0 && result.stderr_text.find("No such container") == string::npos)
        throw sandbox_error("Unable to remove container " + unit_name + ": " + result.stderr_text);
}

}  // namespace codejudge
