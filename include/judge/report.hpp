#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/outcome.hpp"

namespace codejudge {

/**
 * @brief 一个测试用例的评测结果
 * 与 submission 中的测试用例一一对应，顺序相同
 */
struct test_result {
    bool passed = false;

    nlohmann::json expected;

    /**
     * @brief 选手函数的返回值
     * 若评测脚本没有运行完（超时、编译错误、运行时错误），则不存在
     */
    std::optional<nlohmann::json> actual;

    /**
     * @brief 错误信息，如选手函数抛出的异常或者截断后的 stderr
     */
    std::optional<std::string> error;

    std::string description;

    /**
     * @brief 该测试用例的运行时间，单位为毫秒
     */
    double execution_time_ms = 0;
};

/**
 * @brief 一次评测的最终报告，是调用方唯一能看到的结果
 * 报告不持有对评测上下文的任何引用，评测上下文销毁后报告依然有效
 */
struct execution_report {
    std::vector<test_result> results;

    /**
     * @brief 从获得 worker 槽位到评测结束的总时间，单位为毫秒
     */
    double total_time_ms = 0;

    outcome result = outcome::COMPLETED;

    std::size_t passed_tests() const;

    /**
     * @brief 评测正常完成且所有测试用例都通过
     */
    bool success() const;
};

void to_json(nlohmann::json &j, const test_result &result);

/**
 * @code{.json}
 * {
 *     "results": [{"passed": true, "expected": 5, "actual": 5, "description": "2 + 3", "executionTimeMs": 0.02}],
 *     "totalTimeMs": 153.2,
 *     "outcome": "Completed",
 *     "passedTests": 1,
 *     "totalTests": 1,
 *     "success": true
 * }
 * @endcode
 */
void to_json(nlohmann::json &j, const execution_report &report);

}  // namespace codejudge
