#include "config.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

const char *strategy_name(runner_strategy strategy) {
    switch (strategy) {
        case runner_strategy::NATIVE:
            return "native";
        case runner_strategy::SANDBOXED:
            return "sandboxed";
    }
    return "unknown";
}

runner_strategy parse_strategy(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    if (lower == "native")
        return runner_strategy::NATIVE;
    else if (lower == "sandboxed" || lower == "sandbox" || lower == "docker" || lower == "container")
        return runner_strategy::SANDBOXED;
    else
        throw invalid_argument("Unrecognized executor strategy " + name);
}

int parse_memory_size_mb(const string &literal) {
    string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(literal));
    if (value.empty()) throw invalid_argument("Empty memory size");

    int scale = 1;
    char unit = value.back();
    if (unit == 'b' && value.size() > 1) {  // "128mb"
        value.pop_back();
        unit = value.back();
    }
    if (unit == 'k' || unit == 'm' || unit == 'g') {
        value.pop_back();
        if (unit == 'g') scale = 1024;
    }
    try {
        long long amount = boost::lexical_cast<long long>(value);
        if (amount <= 0) throw invalid_argument("Memory size should be positive: " + literal);
        if (unit == 'k') return (int)max(1LL, amount / 1024);
        return (int)(amount * scale);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("Unrecognized memory size " + literal);
    }
}

int language_config::effective_time_limit(runner_strategy actual, int submission_limit_ms) const {
    int override_ms = actual == runner_strategy::NATIVE ? native_timeout_ms : sandbox_timeout_ms;
    return override_ms > 0 ? override_ms : submission_limit_ms;
}

const language_config &engine_config::for_language(language lang) const {
    return languages.at(lang);
}

engine_config default_config() {
    engine_config config;
    unsigned cores = thread::hardware_concurrency();
    config.workers = cores > 0 ? cores : 4;

    config.languages[language::TYPESCRIPT].image = "code-runner";
    config.languages[language::GO].image = "go-runner";
    config.languages[language::PHP].image = "php-runner";
    return config;
}

static void apply_language_json(language_config &lang, const json &j) {
    if (exists(j, "strategy"))
        lang.strategy = parse_strategy(get_value<string>(j, "strategy"));
    assign_optional(j, lang.image, "image");
    assign_optional(j, lang.sandbox_timeout_ms, "sandboxTimeoutMs");
    assign_optional(j, lang.native_timeout_ms, "nativeTimeoutMs");
}

void apply_json_config(engine_config &config, const json &j) {
    if (exists(j, "runDir"))
        config.run_dir = get_value<string>(j, "runDir");
    assign_optional(j, config.workers, "workers");
    assign_optional(j, config.queue_timeout_ms, "queueTimeoutMs");
    assign_optional(j, config.grace_ms, "graceMs");
    assign_optional(j, config.max_time_limit_ms, "maxTimeLimitMs");
    assign_optional(j, config.max_memory_limit_mb, "maxMemoryLimitMb");
    assign_optional(j, config.default_time_limit_ms, "defaultTimeLimitMs");
    assign_optional(j, config.default_memory_limit_mb, "defaultMemoryLimitMb");
    assign_optional(j, config.container_runtime, "containerRuntime");
    assign_optional(j, config.timeout_command, "timeoutCommand");
    assign_optional(j, config.cpu_quota, "cpuQuota");
    assign_optional(j, config.pids_limit, "pidsLimit");
    assign_optional(j, config.output_limit, "outputLimit");
    assign_optional(j, config.error_limit, "errorLimit");

    if (exists(j, "strategy"))
        set_all_strategies(config, parse_strategy(get_value<string>(j, "strategy")));

    if (exists(j, "languages")) {
        for (auto &[name, value] : access(j, "languages").items()) {
            language lang = parse_language(name);
            apply_language_json(config.languages[lang], value);
        }
    }
}

static bool env_flag(const string &key) {
    string value = boost::algorithm::to_lower_copy(get_env(key, ""));
    return value == "true" || value == "1" || value == "yes";
}

template <typename T>
static void assign_env(T &value, const string &key) {
    if (!getenv(key.c_str())) return;
    try {
        value = boost::lexical_cast<T>(get_env(key, ""));
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("Environment variable " + key + " has unrecognized value " + get_env(key, ""));
    }
}

void apply_env_config(engine_config &config) {
    if (getenv("RUNNER_TEMP_DIR"))
        config.run_dir = get_env("RUNNER_TEMP_DIR", "");
    assign_env(config.workers, "WORKER_POOL_SIZE");
    assign_env(config.queue_timeout_ms, "QUEUE_TIMEOUT_MS");
    assign_env(config.cpu_quota, "DOCKER_CPU_QUOTA");
    if (getenv("CONTAINER_RUNTIME"))
        config.container_runtime = get_env("CONTAINER_RUNTIME", "docker");
    if (getenv("DOCKER_MEMORY_LIMIT"))
        config.default_memory_limit_mb = parse_memory_size_mb(get_env("DOCKER_MEMORY_LIMIT", ""));

    // 开发环境下默认直接在宿主机上运行
    string environment = get_env("NODE_ENV", get_env("ENVIRONMENT", ""));
    if (environment == "development")
        set_all_strategies(config, runner_strategy::NATIVE);
    if (getenv("EXECUTOR_STRATEGY"))
        set_all_strategies(config, parse_strategy(get_env("EXECUTOR_STRATEGY", "")));

    language_config &go = config.languages[language::GO];
    if (env_flag("USE_NATIVE_GO_EXECUTOR"))
        go.strategy = runner_strategy::NATIVE;

    int sandbox_timeout = 0;
    assign_env(sandbox_timeout, "DOCKER_TIMEOUT");
    if (sandbox_timeout > 0)
        for (auto &[lang, lang_config] : config.languages)
            lang_config.sandbox_timeout_ms = sandbox_timeout;
    assign_env(go.sandbox_timeout_ms, "DOCKER_GO_TIMEOUT");
    assign_env(go.native_timeout_ms, "NATIVE_GO_TIMEOUT");
}

void set_all_strategies(engine_config &config, runner_strategy strategy) {
    for (auto &[lang, lang_config] : config.languages)
        lang_config.strategy = strategy;
}

void prepare_config(const engine_config &config) {
    if (config.workers == 0)
        throw invalid_argument("Worker pool capacity should be positive");
    error_code ec;
    filesystem::create_directories(config.run_dir, ec);
    if (ec || !filesystem::is_directory(config.run_dir))
        throw invalid_argument("Unable to create run directory " + config.run_dir.string() +
                               (ec ? ": " + ec.message() : string()));
}

}  // namespace codejudge
