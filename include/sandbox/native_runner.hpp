#pragma once

#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 直接在宿主机上运行评测程序
 * 评测程序在评测文件夹中以独立进程组运行，受到沙箱内超时命令、RLIMIT_CPU 以及宿主机截止时间的限制。
 * 没有网络和文件系统隔离，只能用于可信的开发环境。
 */
class native_runner : public sandbox_runner {
public:
    explicit native_runner(const engine_config &config);

    runner_strategy strategy() const override;

    /**
     * @brief 工具链和超时命令都在 PATH 中时可用
     */
    bool is_available(const runnable_artifact &artifact) const override;

protected:
    raw_execution_output execute(execution_context &ctx, const runnable_artifact &artifact,
                                 const resource_limits &limits, std::chrono::steady_clock::time_point deadline) override;
};

}  // namespace codejudge
