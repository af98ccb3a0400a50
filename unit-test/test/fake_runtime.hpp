#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 模拟 docker 命令行的脚本
 * 记录每次调用的参数，run 子命令输出预先设置好的 stdout、stderr 和退出码。
 */
struct fake_runtime {
    explicit fake_runtime(const std::filesystem::path &dir);

    /**
     * @brief 脚本路径，作为 engine_config::container_runtime
     */
    std::string path() const;

    void set_output(const std::string &stdout_text, const std::string &stderr_text = "", int exitcode = 0);

    /**
     * @brief 让 run 子命令先睡眠 seconds 秒，模拟不会结束的容器
     */
    void set_sleep(int seconds);

    /**
     * @brief 让 rm 子命令失败
     */
    void fail_removal();

    /**
     * @brief 所有调用的参数，每次调用一行
     */
    std::vector<std::string> calls() const;

    /**
     * @brief 以 prefix 开头的调用次数
     */
    int count_calls(const std::string &prefix) const;

private:
    std::filesystem::path state_dir;
};

}  // namespace codejudge
