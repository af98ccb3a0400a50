#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 选手程序的运行方式
 */
enum class runner_strategy {
    /**
     * @brief 直接在宿主机上以子进程运行
     * 速度快，但只有 rlimit 限制，只能用于可信的开发环境
     */
    NATIVE,

    /**
     * @brief 在容器中运行
     * 禁用网络，只读挂载评测文件夹，限制内存、CPU 和进程数
     */
    SANDBOXED
};

const char *strategy_name(runner_strategy strategy);

/**
 * @brief 解析运行方式，接受 "native"、"sandboxed"，以及 "docker"、"container" 作为 sandboxed 的别名
 * @throws std::invalid_argument 若无法识别
 */
runner_strategy parse_strategy(const std::string &name);

/**
 * @brief 解析内存大小，如 "128m"、"1g"、"512"（不带单位时视为 MB）
 * @return 以 MB 为单位的内存大小
 * @throws std::invalid_argument 若格式不正确
 */
int parse_memory_size_mb(const std::string &literal);

/**
 * @brief 单个语言的配置
 */
struct language_config {
    runner_strategy strategy = runner_strategy::SANDBOXED;

    /**
     * @brief 沙箱运行时使用的容器镜像
     * 镜像内需要安装该语言的工具链以及 timeout 命令
     */
    std::string image;

    /**
     * @brief 沙箱运行时的时间限制覆盖值，单位为毫秒
     * 大于 0 时替代提交中的时间限制
     */
    int sandbox_timeout_ms = 0;

    /**
     * @brief 宿主机直接运行时的时间限制覆盖值，单位为毫秒
     */
    int native_timeout_ms = 0;

    /**
     * @brief 计算实际生效的时间限制
     */
    int effective_time_limit(runner_strategy actual, int submission_limit_ms) const;
};

/**
 * @brief 评测引擎配置
 * 加载顺序：默认值 -> JSON 配置文件 -> 环境变量 -> 命令行参数，后者覆盖前者。
 */
struct engine_config {
    /**
     * @brief 存放每次评测的临时文件夹
     *
     * run_dir
     * └── exec-<uuid> // 一次评测的文件夹，评测结束后删除
     *     ├── solution.ts / solution.go / solution.php // 选手代码和评测脚本
     *     └── .scratch // 宿主机直接运行时的可写目录（如 Go 的编译缓存）
     */
    std::filesystem::path run_dir = std::filesystem::temp_directory_path() / "codejudge";

    /**
     * @brief worker 池的容量，即同时评测的提交数量上限
     */
    std::size_t workers = 4;

    /**
     * @brief 等待 worker 池空闲槽位的最长时间，单位为毫秒
     */
    int queue_timeout_ms = 30000;

    /**
     * @brief 宿主机监控在时间限制之外额外等待的时间，单位为毫秒
     * 包括编译、容器启动以及容器销毁的时间
     */
    int grace_ms = 2000;

    int max_time_limit_ms = 60000;
    int max_memory_limit_mb = 1024;

    /**
     * @brief 提交中没有给出限制时使用的默认值
     */
    int default_time_limit_ms = 5000;
    int default_memory_limit_mb = 128;

    /**
     * @brief 容器运行时，需要兼容 docker 的命令行接口（如 podman）
     */
    std::string container_runtime = "docker";

    /**
     * @brief 沙箱内部用来限制运行时间的命令，需要兼容 coreutils 的 timeout
     */
    std::string timeout_command = "timeout";

    /**
     * @brief 容器的 CPU 配额，以 100000 为一个 CPU
     */
    long cpu_quota = 100000;

    /**
     * @brief 容器内最多能创建的进程数
     */
    int pids_limit = 64;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    std::size_t output_limit = 1 << 20;

    /**
     * @brief 评测结果中错误信息最多保留的字节数
     */
    std::size_t error_limit = 2000;

    std::map<language, language_config> languages;

    /**
     * @brief 获取语言的配置
     * @throws std::out_of_range 若该语言没有配置
     */
    const language_config &for_language(language lang) const;
};

/**
 * @brief 构造默认配置
 * 默认镜像为 code-runner（TypeScript）、go-runner（Go）、php-runner（PHP），
 * 默认所有语言在沙箱中运行
 */
engine_config default_config();

/**
 * @brief 从 JSON 配置文件读取配置，覆盖 config 中已有的值
 * @code{.json}
 * {
 *     "runDir": "/tmp/codejudge",
 *     "workers": 8,
 *     "strategy": "sandboxed",
 *     "languages": {
 *         "go": {"strategy": "native", "image": "go-runner", "nativeTimeoutMs": 15000}
 *     }
 * }
 * @endcode
 * @throws std::invalid_argument 若某个键的值类型不正确
 */
void apply_json_config(engine_config &config, const nlohmann::json &j);

/**
 * @brief 从环境变量读取配置，覆盖 config 中已有的值
 * 支持 RUNNER_TEMP_DIR、WORKER_POOL_SIZE、QUEUE_TIMEOUT_MS、EXECUTOR_STRATEGY、NODE_ENV、
 * ENVIRONMENT、USE_NATIVE_GO_EXECUTOR、DOCKER_TIMEOUT、DOCKER_GO_TIMEOUT、NATIVE_GO_TIMEOUT、
 * DOCKER_MEMORY_LIMIT、DOCKER_CPU_QUOTA、CONTAINER_RUNTIME
 */
void apply_env_config(engine_config &config);

/**
 * @brief 将所有语言的运行方式设为 strategy
 */
void set_all_strategies(engine_config &config, runner_strategy strategy);

/**
 * @brief 检查最终的配置，并创建运行目录
 * @throws std::invalid_argument 若 worker 池容量为 0 或者运行目录无法创建
 */
void prepare_config(const engine_config &config);

/**
 * @brief 是否开启调试模式
 * 调试模式下评测结束后不会删除评测文件夹，且会打印运行的命令
 */
extern bool DEBUG;

}  // namespace codejudge
