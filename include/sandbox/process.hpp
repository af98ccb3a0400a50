#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 运行外部程序的参数
 */
struct process_options {
    /**
     * @brief 命令行参数，argv[0] 会在 PATH 中查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 额外的环境变量，覆盖继承的同名环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 是否继承当前进程的环境变量
     */
    bool inherit_env = true;

    /**
     * @brief 子进程的工作目录，为空时不切换
     */
    std::filesystem::path work_dir;

    /**
     * @brief 宿主机上的截止时间，到达后杀死整个进程组
     */
    std::optional<std::chrono::steady_clock::time_point> deadline;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     * stdout 保留最后的 output_limit 字节（评测脚本的结果在最后一行），stderr 保留最前面的部分
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief RLIMIT_CPU，单位为秒，0 表示不限制
     */
    int cpu_limit_seconds = 0;

    /**
     * @brief RLIMIT_DATA，单位为字节，0 表示不限制
     */
    long long data_limit_bytes = 0;
};

/**
 * @brief 外部程序的运行结果
 */
struct process_result {
    pid_t pid = -1;

    /**
     * @brief 退出码，若被信号杀死则为 128 + 信号值（与 shell 的约定一致）
     */
    int exitcode = 0;

    /**
     * @brief 杀死进程的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 是否因为到达截止时间被宿主机杀死
     */
    bool timed_out = false;

    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief stdout 或 stderr 是否因为超出限制被截断
     */
    bool truncated = false;

    double wall_time_ms = 0;
};

/**
 * @brief 运行外部程序，等待其结束并收集输出
 * 子进程拥有独立的进程组，stdin 重定向到 /dev/null。
 * 到达截止时间后向整个进程组发送 SIGKILL；子进程正常结束后同样会清理进程组中残留的后台进程。
 * @throws std::system_error 若 fork 失败、工作目录不存在或者程序无法执行
 */
process_result run_process(const process_options &options);

/**
 * @brief 检查进程是否仍然存活（僵尸进程视为已结束）
 */
bool is_process_alive(pid_t pid);

}  // namespace codejudge
