#pragma once

#include <string>
#include <vector>
#include "judge/report.hpp"
#include "judge/submission.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {

class language_adapter;

/**
 * @brief 解析后的评测结果
 */
struct parsed_result {
    std::vector<test_result> results;
    outcome result = outcome::COMPLETED;
};

/**
 * @brief 将评测程序的原始输出解析为每个测试用例的评测结果
 * 解析规则：
 * 1. 超时：结果为 Timeout，所有测试用例不通过，错误信息给出时间限制；
 * 2. 非零退出码且 stdout 不是 JSON：若 stderr 包含编译错误特征，结果为 CompileError，否则为 RuntimeError；
 *    所有测试用例不通过，错误信息为截断后的 stderr，没有 actual；
 * 3. stdout 是 JSON 数组但长度与测试用例数量不同，或者 stdout 无法解析且程序正常退出：结果为 SandboxError，
 *    不会截断或补齐；
 * 4. 其他情况：结果为 Completed，按顺序对应每个测试用例。
 * 选手程序可能向 stdout 打印内容，因此只解析 stdout 的最后一个非空行。
 */
class result_parser {
public:
    /**
     * @param markers 编译错误特征字符串
     * @param error_limit 错误信息最多保留的字节数
     */
    result_parser(std::vector<std::string> markers, std::size_t error_limit);

    /**
     * @brief 根据语言适配器的编译错误特征构造解析器
     */
    result_parser(const language_adapter &adapter, std::size_t error_limit);

    /**
     * @param raw 评测程序的原始输出
     * @param test_cases 提交中的测试用例，期望值和描述以这里为准
     * @param time_limit_ms 实际生效的时间限制，用于超时的错误信息
     */
    parsed_result parse(const raw_execution_output &raw, const std::vector<test_case> &test_cases, int time_limit_ms) const;

    /**
     * @brief stderr 是否包含编译错误特征
     */
    bool is_compile_error(const std::string &stderr_text) const;

private:
    std::vector<std::string> markers;
    std::size_t error_limit;
    const language_adapter *adapter = nullptr;
};

/**
 * @brief 构造所有测试用例都不通过的评测结果，测试用例都没有 actual
 */
parsed_result fail_all(const std::vector<test_case> &test_cases, outcome result, const std::string &error,
                       double time_per_test);

/**
 * @brief 取出文本中最后一个非空行
 */
std::string last_non_empty_line(const std::string &text);

}  // namespace codejudge
