#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 表示一次提交评测的最终结果类型
 */
enum class outcome {
    /**
     * @brief 评测脚本正常运行完所有测试用例
     * 测试用例是否通过见每个测试用例各自的结果。
     */
    COMPLETED = 0,

    /**
     * @brief 选手程序编译错误
     * 程序异常退出，stdout 不是合法的 JSON，且 stderr 包含该语言编译器的诊断信息。
     */
    COMPILE_ERROR = 1,

    /**
     * @brief 选手程序运行时错误
     * 程序异常退出，stdout 不是合法的 JSON，且 stderr 不包含编译错误信息。
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 选手程序运行时间超出限制
     * 无论是沙箱内部的 timeout 还是宿主机上的监控超时，都会返回该结果。
     * 这种情况下不会解析部分输出。
     */
    TIMEOUT = 3,

    /**
     * @brief 沙箱内部错误
     * 容器创建或销毁失败，或者评测脚本输出的结果数量和测试用例数量不一致。
     * 这种错误会记录日志，但不会把详细信息返回给选手。
     */
    SANDBOX_ERROR = 4
};

/**
 * @brief 结果类型在评测报告中的名字，如 "Completed"、"CompileError"
 */
const char *get_display_message(outcome);

/**
 * @brief 根据报告中的名字解析结果类型
 * @throws std::invalid_argument 若名字无法识别
 */
outcome parse_outcome(const std::string &name);

}  // namespace codejudge
