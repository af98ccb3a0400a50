#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "config.hpp"
#include "sandbox/execution_context.hpp"

namespace codejudge {

/**
 * @brief 由 language_adapter 生成的可运行评测程序
 */
struct runnable_artifact {
    /**
     * @brief 评测文件夹，即 execution_context::artifact_dir
     * 沙箱运行时以只读方式挂载到容器的 /code
     */
    std::filesystem::path dir;

    /**
     * @brief 运行命令，相对路径相对于评测文件夹
     * @code{.cpp}
     *     {"go", "run", "main.go", "solution.go"}
     * @endcode
     */
    std::vector<std::string> command;

    /**
     * @brief 运行时的环境变量
     * 值中的 ${SCRATCH} 会被替换为可写的临时目录：宿主机上为评测文件夹下的 .scratch，
     * 容器中为 /tmp
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 沙箱运行时使用的容器镜像
     */
    std::string image;

    /**
     * @brief 宿主机直接运行时需要的工具链，用于检测是否可以直接运行
     */
    std::string toolchain;
};

/**
 * @brief 运行评测程序时的资源限制
 */
struct resource_limits {
    /**
     * @brief 时间限制，单位为毫秒
     */
    int time_limit_ms = 5000;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit_mb = 128;

    /**
     * @brief CPU 配额，以 100000 为一个 CPU
     */
    long cpu_quota = 100000;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    std::size_t output_limit = 1 << 20;
};

/**
 * @brief 评测程序的原始输出，交给 result_parser 解析
 */
struct raw_execution_output {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;

    /**
     * @brief 是否超时，包括沙箱内 timeout 命令杀死程序以及宿主机杀死程序两种情况
     * 超时时不会解析部分输出
     */
    bool timed_out = false;

    double wall_time_ms = 0;
};

/**
 * @brief 评测程序运行器
 * 运行器只负责运行，不理解评测脚本的输出格式
 */
class sandbox_runner {
public:
    virtual ~sandbox_runner();

    virtual runner_strategy strategy() const = 0;

    /**
     * @brief 检查宿主机环境是否可以运行该评测程序
     * 比如直接运行时需要工具链在 PATH 中，沙箱运行时需要容器运行时在 PATH 中
     */
    virtual bool is_available(const runnable_artifact &artifact) const = 0;

    /**
     * @brief 运行评测程序
     * 运行中创建的资源（如容器）会注册到 ctx 中，无论运行是否成功都会被销毁。
     * 运行抛出异常时，ctx 中的资源会先被销毁再重新抛出异常。
     * @param ctx 本次评测的上下文
     * @param deadline 宿主机上的截止时间，到达后强制终止评测程序
     * @throws sandbox_error 若沙箱本身出错，比如容器无法创建
     */
    raw_execution_output run(execution_context &ctx, const runnable_artifact &artifact,
                             const resource_limits &limits, std::chrono::steady_clock::time_point deadline);

protected:
    virtual raw_execution_output execute(execution_context &ctx, const runnable_artifact &artifact,
                                         const resource_limits &limits, std::chrono::steady_clock::time_point deadline) = 0;

    /**
     * @brief 构造沙箱内的超时命令前缀，如 {"timeout", "-s", "KILL", "2.500"}
     */
    std::vector<std::string> timeout_prefix(const resource_limits &limits) const;

    /**
     * @brief 根据退出码和运行时间判断评测程序是否被超时命令杀死
     */
    static bool killed_by_timeout(int exit_code, double wall_time_ms, const resource_limits &limits);

    std::string timeout_command = "timeout";
};

/**
 * @brief 将 env 中的 ${SCRATCH} 替换为 scratch
 */
std::map<std::string, std::string> expand_scratch(const std::map<std::string, std::string> &env, const std::string &scratch);

}  // namespace codejudge
