#pragma once

#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief PHP 适配器
 * 选手代码原样写入 solution.php，评测脚本 runner.php 引入选手代码后逐个调用选手函数。
 * PHP 命令行默认把错误信息输出到 stdout，因此运行时通过 display_errors=stderr 重定向到 stderr。
 */
class php_adapter : public language_adapter {
public:
    explicit php_adapter(const language_config &config);

    language lang() const override;

    runnable_artifact prepare(const submission &submit, const std::filesystem::path &dir) const override;

    std::vector<std::string> compile_error_markers() const override;

    /**
     * @brief 生成 runner.php 的内容
     */
    std::string generate_harness(const submission &submit) const;
};

/**
 * @brief 将文本转换为 PHP 的单引号字符串字面量
 */
std::string php_quote(const std::string &text);

}  // namespace codejudge
