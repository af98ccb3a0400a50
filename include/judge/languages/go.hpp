#pragma once

#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief Go 适配器
 * 选手代码写入 solution.go，评测脚本写入 main.go，通过 go run 编译并执行。
 * 评测脚本通过反射调用选手函数，参数按照函数签名从 JSON 解码。
 */
class go_adapter : public language_adapter {
public:
    explicit go_adapter(const language_config &config);

    language lang() const override;

    runnable_artifact prepare(const submission &submit, const std::filesystem::path &dir) const override;

    std::vector<std::string> compile_error_markers() const override;

    /**
     * @brief 在编译器诊断信息前加上便于选手理解的说明
     */
    std::string describe_compile_error(const std::string &diagnostics) const override;

    /**
     * @brief 生成 main.go 的内容
     */
    std::string generate_harness(const submission &submit) const;
};

/**
 * @brief 整理选手的 Go 代码
 * 将 package 声明替换为 package main（没有时在开头加上），并删除 func main() 函数。
 * import 声明会保留，因为选手代码和评测脚本在不同的文件中。
 */
std::string clean_go_source(const std::string &source);

/**
 * @brief 将文本转换为 Go 的双引号字符串字面量
 */
std::string go_quote(const std::string &text);

}  // namespace codejudge
