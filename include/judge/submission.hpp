#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

/**
 * 这个头文件包含提交信息
 * 包含：
 * 1. language 枚举（表示评测引擎支持的语言）
 * 2. test_case 类（表示一个测试用例）
 * 3. submission 类（表示一个选手提交）
 */
namespace codejudge {

/**
 * @brief 评测引擎支持的语言
 * 这是一个封闭的集合，每个语言都有且只有一个 language_adapter 负责
 */
enum class language {
    /**
     * @brief TypeScript/JavaScript，通过 ts-node 执行
     * 提交中的 "javascript" 也会映射到这里
     */
    TYPESCRIPT,

    /**
     * @brief Go，通过 go run 编译并执行
     */
    GO,

    /**
     * @brief PHP，通过 php 命令行执行
     */
    PHP
};

/**
 * @brief 语言在提交和配置文件中的名字，如 "typescript"、"go"、"php"
 */
const char *language_name(language lang);

/**
 * @brief 根据提交中的语言名解析语言
 * @param name 语言名，大小写不敏感，"javascript"、"js"、"ts" 都会映射到 TYPESCRIPT
 * @throws invalid_submission 若语言不受支持
 */
language parse_language(const std::string &name);

/**
 * @brief 表示一个测试用例
 * 测试用例的顺序决定评测结果的顺序，必须从提交一直保持到评测报告
 */
struct test_case {
    /**
     * @brief 传给选手函数的参数
     * 若为数组，则数组的每个元素依次作为一个参数传入；否则整体作为唯一的参数传入
     * @code{.json}
     * [2, 3]
     * @endcode
     */
    nlohmann::json input;

    /**
     * @brief 期望的返回值
     */
    nlohmann::json expected;

    /**
     * @brief 测试用例描述，原样返回给选手
     */
    std::string description;
};

/**
 * @brief 表示一个选手提交
 * 提交被接受后不可修改，且只属于一次评测
 */
struct submission {
    /**
     * @brief 选手提交的源代码
     * 对于 TypeScript 和 Go，源代码需要定义名为 function_name 的函数；
     * 对于 PHP，源代码需要包含 <?php 开头标记
     */
    std::string source_code;

    language lang = language::TYPESCRIPT;

    /**
     * @brief 有序的测试用例列表，不能为空
     */
    std::vector<test_case> test_cases;

    /**
     * @brief 评测脚本调用的选手函数名
     * 这个名字会被拼接到生成的评测脚本中，因此必须是合法的标识符
     */
    std::string function_name;

    /**
     * @brief 时间限制，单位为毫秒
     */
    int time_limit_ms = 0;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit_mb = 0;
};

/**
 * @brief 检查函数名是否为合法的标识符 [A-Za-z_][A-Za-z0-9_]*
 */
bool is_valid_identifier(const std::string &name);

/**
 * @brief 从 JSON 中读取提交
 * @code{.json}
 * {
 *     "sourceCode": "function add(a, b) { return a + b; }",
 *     "language": "typescript",
 *     "functionName": "add",
 *     "testCases": [{"input": [2, 3], "expected": 5, "description": "2 + 3"}],
 *     "timeLimitMs": 2000,
 *     "memoryLimitMb": 128
 * }
 * @endcode
 * @param default_time_limit_ms 若 JSON 中没有 timeLimitMs，使用这个值
 * @param default_memory_limit_mb 若 JSON 中没有 memoryLimitMb，使用这个值
 * @throws invalid_submission 若 JSON 格式不正确
 */
submission parse_submission(const nlohmann::json &j, int default_time_limit_ms, int default_memory_limit_mb);

/**
 * @brief 将测试用例列表序列化为评测脚本内嵌的 JSON
 */
nlohmann::json test_cases_to_json(const std::vector<test_case> &test_cases);

std::ostream &operator<<(std::ostream &os, const submission &submit);

}  // namespace codejudge
