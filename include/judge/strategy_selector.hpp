#pragma once

#include <memory>
#include "config.hpp"
#include "judge/language.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 根据配置为每个语言选择运行器
 * 语言配置为直接运行、但宿主机上找不到该语言的工具链时，回退到沙箱运行并记录警告。
 */
class strategy_selector {
public:
    strategy_selector(std::unique_ptr<sandbox_runner> native, std::unique_ptr<sandbox_runner> sandboxed);

    /**
     * @brief 使用 native_runner 和 container_runner 构造
     */
    explicit strategy_selector(const engine_config &config);

    /**
     * @brief 选择运行器
     * @param adapter 语言适配器，决定配置的运行方式
     * @param artifact 评测程序，用于检测工具链是否可用
     */
    sandbox_runner &select(const language_adapter &adapter, const runnable_artifact &artifact) const;

private:
    std::unique_ptr<sandbox_runner> native;
    std::unique_ptr<sandbox_runner> sandboxed;
};

}  // namespace codejudge
