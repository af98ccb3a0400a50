#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codejudge {

/**
 * @brief 评测引擎所有异常的基类
 * 构造时记录调用栈，便于在日志中定位内部错误。
 * 调用栈只会写入日志，绝不会出现在返回给调用方的评测报告中。
 */
struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交不合法，在评测开始前就被拒绝
 * 比如语言不支持、没有测试用例、时间或内存限制超出管理员设置的上限。
 * 这是调用方的错误，不应该重试。
 */
struct invalid_submission : public engine_exception {
    invalid_submission();
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 表示 worker 池已满，且在排队期限内没有空闲的槽位
 * 这是暂时性错误，调用方可以退避后重试。
 */
struct overloaded : public engine_exception {
    overloaded();
    explicit overloaded(const std::string &message);
};

/**
 * @brief 表示沙箱本身出错
 * 比如容器创建失败、容器销毁失败、评测脚本和结果解析器之间的协议不一致。
 * 由 dispatcher 捕获并降级为 SandboxError 评测结果。
 */
struct sandbox_error : public engine_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

}  // namespace codejudge
