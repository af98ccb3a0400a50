#pragma once

#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief TypeScript/JavaScript 适配器
 * 选手代码和评测脚本合并为 solution.ts，通过 ts-node --transpile-only 执行，不做类型检查。
 * 选手函数可以返回 Promise，评测脚本会等待其完成。
 */
class typescript_adapter : public language_adapter {
public:
    explicit typescript_adapter(const language_config &config);

    language lang() const override;

    runnable_artifact prepare(const submission &submit, const std::filesystem::path &dir) const override;

    std::vector<std::string> compile_error_markers() const override;

    /**
     * @brief 生成 solution.ts 的内容
     */
    std::string generate_harness(const submission &submit) const;
};

}  // namespace codejudge
