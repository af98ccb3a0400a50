#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/submission.hpp"
#include "sandbox/runner.hpp"

namespace codejudge {

/**
 * @brief 语言适配器，评测引擎中唯一理解语言语法的部分
 * 负责把选手代码包装进评测脚本：评测脚本按顺序对每个测试用例调用选手函数，
 * 用该语言适合的深比较规则比较返回值和期望值，最后在 stdout 上输出一行 JSON 数组，
 * 数组的每个元素为 {passed, expected, actual, error?, description, executionTimeMs}。
 *
 * 测试数据以转义后的 JSON 字面量嵌入评测脚本，函数名在提交时已经校验为合法的标识符，
 * 文件名由适配器固定，不会使用调用方提供的路径。
 */
class language_adapter {
public:
    explicit language_adapter(const language_config &config);
    virtual ~language_adapter();

    virtual language lang() const = 0;

    /**
     * @brief 在 dir 中生成评测脚本和选手代码
     * @param submit 选手提交
     * @param dir 评测文件夹，即 execution_context::artifact_dir
     * @return 可以交给 sandbox_runner 运行的评测程序
     * @throws std::system_error 若文件无法写入
     */
    virtual runnable_artifact prepare(const submission &submit, const std::filesystem::path &dir) const = 0;

    /**
     * @brief 该语言配置的运行方式
     * 两种运行方式下评测脚本的输出格式完全相同
     */
    runner_strategy strategy() const;

    /**
     * @brief 编译器诊断信息的特征字符串
     * stderr 中包含任意一个时，异常退出被视为编译错误
     */
    virtual std::vector<std::string> compile_error_markers() const = 0;

    /**
     * @brief 把编译器的诊断信息转换为返回给选手的错误信息
     */
    virtual std::string describe_compile_error(const std::string &diagnostics) const;

    const language_config &config() const;

protected:
    language_config lang_config;
};

typedef std::map<language, std::unique_ptr<language_adapter>> adapter_table;

/**
 * @brief 构造所有支持的语言的适配器
 */
adapter_table make_adapters(const engine_config &config);

/**
 * @brief 将 JSON 序列化为只包含 ASCII 字符的字面量
 */
std::string ascii_json(const nlohmann::json &value);

}  // namespace codejudge
