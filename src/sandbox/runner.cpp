#include "sandbox/runner.hpp"
#include <fmt/format.h>
#include <boost/algorithm/string/replace.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

sandbox_runner::~sandbox_runner() {}

raw_execution_output sandbox_runner::run(execution_context &ctx, const runnable_artifact &artifact,
                                         const resource_limits &limits, chrono::steady_clock::time_point deadline) {
    raw_execution_output output;
    try {
        output = execute(ctx, artifact, limits, deadline);
    } catch (...) {
        // 先销毁容器和评测文件夹，再把异常交给调用方
        ctx.teardown_nothrow();
        throw;
    }
    ctx.teardown();
    return output;
}

vector<string> sandbox_runner::timeout_prefix(const resource_limits &limits) const {
    // GNU timeout 接受小数秒，时长为 0 则表示不限制
    double seconds = max(limits.time_limit_ms, 1) / 1000.0;
    return make_command(timeout_command, "-s", "KILL", fmt::format("{:.3f}", seconds));
}

bool sandbox_runner::killed_by_timeout(int exit_code, double wall_time_ms, const resource_limits &limits) {
    // timeout 命令在超时时返回 124，使用 -s KILL 时为 137
    return (exit_code == 124 || exit_code == 137) && wall_time_ms >= limits.time_limit_ms;
}

map<string, string> expand_scratch(const map<string, string> &env, const string &scratch) {
    map<string, string> result;
    for (auto &[key, value] : env)
        result[key] = boost::algorithm::replace_all_copy(value, "${SCRATCH}", scratch);
    return result;
}

}  // namespace codejudge
