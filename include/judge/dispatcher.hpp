#pragma once

#include <memory>
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/report.hpp"
#include "judge/strategy_selector.hpp"
#include "judge/submission.hpp"
#include "judge/worker_pool.hpp"

namespace codejudge {

/**
 * @brief 评测调度器，评测引擎的入口
 * 每次评测在调用方的线程上运行，流程为：
 * 1. 校验提交，不合法时抛出 invalid_submission；
 * 2. 从 worker 池获取槽位，等待超时时抛出 overloaded；
 * 3. 创建评测上下文，由语言适配器生成评测程序；
 * 4. 由运行器在截止时间（时间限制 + grace）之内运行评测程序；
 * 5. 解析输出，生成评测报告；
 * 6. 销毁评测上下文，然后才归还槽位。
 * 运行器的任何失败（容器创建失败、销毁失败等）都会被记录日志并降级为 SandboxError 评测结果，
 * 调用方永远不会看到调用栈。
 */
class dispatcher {
public:
    /**
     * @param config 评测引擎配置
     * @param pool worker 池，生命周期必须长于 dispatcher
     * @param adapters 语言适配器表
     * @param selector 运行器选择
     */
    dispatcher(const engine_config &config, worker_pool &pool, adapter_table adapters, std::unique_ptr<strategy_selector> selector);

    /**
     * @brief 使用默认的语言适配器和运行器构造
     */
    dispatcher(const engine_config &config, worker_pool &pool);

    /**
     * @brief 校验提交
     * @throws invalid_submission 若语言不支持、没有测试用例、函数名不是合法标识符，
     *         或者时间、内存限制不在 (0, 上限] 范围内
     */
    void validate(const submission &submit) const;

    /**
     * @brief 评测一个提交
     * @throws invalid_submission 若提交不合法
     * @throws overloaded 若在排队期限内没有空闲的槽位
     */
    execution_report execute(const submission &submit);

private:
    engine_config config;
    worker_pool &pool;
    adapter_table adapters;
    std::unique_ptr<strategy_selector> selector;
};

}  // namespace codejudge
