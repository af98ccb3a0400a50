#pragma once

#include <string>
#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 在容器中运行评测程序
 * 评测文件夹以只读方式挂载到容器的 /code，工作目录为 /code，只有 /tmp 可写。
 * 容器禁用网络，并限制内存、CPU 配额和进程数。
 * 运行时间受到两层限制：容器内的超时命令，以及宿主机上的截止时间（到达后强制杀死容器）。
 * 容器的销毁会注册到 execution_context 中，无论运行结果如何都会执行。
 */
class container_runner : public sandbox_runner {
public:
    explicit container_runner(const engine_config &config);

    runner_strategy strategy() const override;

    /**
     * @brief 容器运行时在 PATH 中时可用
     */
    bool is_available(const runnable_artifact &artifact) const override;

    /**
     * @brief 构造 docker run 的完整参数列表
     */
    std::vector<std::string> build_run_command(const std::string &unit_name, const runnable_artifact &artifact,
                                               const resource_limits &limits) const;

protected:
    raw_execution_output execute(execution_context &ctx, const runnable_artifact &artifact,
                                 const resource_limits &limits, std::chrono::steady_clock::time_point deadline) override;

private:
    /**
     * @brief 强制杀死容器，失败时只记录日志，容器最终会在 teardown 中被删除
     */
    void kill_unit(const std::string &unit_name) const;

    /**
     * @brief 删除容器，容器不存在时视为成功
     * @throws sandbox_error 若删除失败或者超时
     */
    void remove_unit(const std::string &unit_name) const;

    std::string runtime;
    int pids_limit;
    int teardown_timeout_ms;
};

}  // namespace codejudge
