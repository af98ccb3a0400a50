#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 一次评测的临时资源
 * 包括评测文件夹 run_dir/exec-<uuid>，以及沙箱运行时创建的容器。
 * 评测结束时（无论成功、选手程序出错、超时还是内部错误）都必须销毁，
 * 任何评测都不允许遗留临时文件或者仍在运行的容器。
 *
 * 析构函数会调用 teardown_nothrow，因此在任何异常路径上资源都会被释放；
 * 正常路径上应该显式调用 teardown，以便把销毁失败报告为 sandbox_error。
 */
struct execution_context {
    /**
     * @brief 创建评测文件夹
     * @param run_dir 存放所有评测文件夹的目录，不存在时会自动创建
     * @param keep_artifacts 若为真，销毁时保留评测文件夹（调试用）
     * @throws std::filesystem::filesystem_error 若文件夹无法创建
     */
    execution_context(const std::filesystem::path &run_dir, bool keep_artifacts = false);

    execution_context(const execution_context &) = delete;
    execution_context &operator=(const execution_context &) = delete;

    ~execution_context();

    /**
     * @brief 本次评测的唯一标识，为随机生成的 uuid
     */
    const std::string &id() const;

    /**
     * @brief 本次评测的文件夹，存放生成的评测脚本和选手代码
     */
    const std::filesystem::path &artifact_dir() const;

    /**
     * @brief 本次评测的容器名，形如 codejudge-<uuid>
     */
    std::string unit_name() const;

    /**
     * @brief 注册一个需要在销毁时执行的清理函数，比如删除容器
     * 清理函数按注册的逆序执行，最后删除评测文件夹
     */
    void register_unit(const std::string &name, std::function<void()> teardown);

    /**
     * @brief 销毁所有资源，可以重复调用
     * 即使某个清理函数失败，其余清理函数和文件夹删除依然会执行
     * @throws sandbox_error 若有任何资源销毁失败
     */
    void teardown();

    /**
     * @brief 销毁所有资源，失败时只记录日志
     */
    void teardown_nothrow() noexcept;

    bool torn_down() const;

private:
    std::string uuid;
    std::filesystem::path dir;
    bool keep_artifacts;
    bool finished = false;
    std::vector<std::pair<std::string, std::function<void()>>> units;
};

}  // namespace codejudge
