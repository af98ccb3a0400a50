#include <cstdlib>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace codejudge;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto key : {"RUNNER_TEMP_DIR", "WORKER_POOL_SIZE", "QUEUE_TIMEOUT_MS", "EXECUTOR_STRATEGY", "NODE_ENV",
                         "ENVIRONMENT", "USE_NATIVE_GO_EXECUTOR", "DOCKER_TIMEOUT", "DOCKER_GO_TIMEOUT",
                         "NATIVE_GO_TIMEOUT", "DOCKER_MEMORY_LIMIT", "DOCKER_CPU_QUOTA", "CONTAINER_RUNTIME"})
            unsetenv(key);
    }
};

TEST_F(ConfigTest, DefaultConfigTest) {
    engine_config config = default_config();
    EXPECT_GT(config.workers, 0u);
    EXPECT_EQ(config.queue_timeout_ms, 30000);
    EXPECT_EQ(config.container_runtime, "docker");
    EXPECT_EQ(config.cpu_quota, 100000);
    EXPECT_EQ(config.for_language(language::TYPESCRIPT).image, "code-runner");
    EXPECT_EQ(config.for_language(language::GO).image, "go-runner");
    EXPECT_EQ(config.for_language(language::PHP).image, "php-runner");
    EXPECT_EQ(config.for_language(language::GO).strategy, runner_strategy::SANDBOXED);
}

TEST_F(ConfigTest, MemorySizeTest) {
    EXPECT_EQ(parse_memory_size_mb("128m"), 128);
    EXPECT_EQ(parse_memory_size_mb("128MB"), 128);
    EXPECT_EQ(parse_memory_size_mb("1g"), 1024);
    EXPECT_EQ(parse_memory_size_mb("512"), 512);
    EXPECT_EQ(parse_memory_size_mb("2048k"), 2);
    EXPECT_THROW(parse_memory_size_mb("lots"), invalid_argument);
    EXPECT_THROW(parse_memory_size_mb("-5m"), invalid_argument);
}

TEST_F(ConfigTest, StrategyNamesTest) {
    EXPECT_EQ(parse_strategy("native"), runner_strategy::NATIVE);
    EXPECT_EQ(parse_strategy("Docker"), runner_strategy::SANDBOXED);
    EXPECT_EQ(parse_strategy("sandboxed"), runner_strategy::SANDBOXED);
    EXPECT_THROW(parse_strategy("vm"), invalid_argument);
}

TEST_F(ConfigTest, JsonConfigTest) {
    engine_config config = default_config();
    apply_json_config(config, R"({
        "runDir": "/var/tmp/judge",
        "workers": 8,
        "graceMs": 500,
        "strategy": "native",
        "languages": {
            "php": {"strategy": "sandboxed", "image": "my-php", "sandboxTimeoutMs": 9000}
        }
    })"_json);
    EXPECT_EQ(config.run_dir.string(), "/var/tmp/judge");
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.grace_ms, 500);
    EXPECT_EQ(config.for_language(language::GO).strategy, runner_strategy::NATIVE);
    EXPECT_EQ(config.for_language(language::PHP).strategy, runner_strategy::SANDBOXED);
    EXPECT_EQ(config.for_language(language::PHP).image, "my-php");
    EXPECT_EQ(config.for_language(language::PHP).sandbox_timeout_ms, 9000);
}

TEST_F(ConfigTest, JsonConfigTypeMismatchTest) {
    engine_config config = default_config();
    EXPECT_THROW(apply_json_config(config, R"({"workers": "many"})"_json), invalid_argument);
}

TEST_F(ConfigTest, EnvironmentConfigTest) {
    set_env("RUNNER_TEMP_DIR", "/tmp/runner");
    set_env("WORKER_POOL_SIZE", "3");
    set_env("USE_NATIVE_GO_EXECUTOR", "true");
    set_env("DOCKER_TIMEOUT", "7000");
    set_env("DOCKER_GO_TIMEOUT", "12000");
    set_env("NATIVE_GO_TIMEOUT", "15000");
    set_env("DOCKER_MEMORY_LIMIT", "256m");
    set_env("CONTAINER_RUNTIME", "podman");

    engine_config config = default_config();
    apply_env_config(config);
    EXPECT_EQ(config.run_dir.string(), "/tmp/runner");
    EXPECT_EQ(config.workers, 3u);
    EXPECT_EQ(config.default_memory_limit_mb, 256);
    EXPECT_EQ(config.container_runtime, "podman");
    EXPECT_EQ(config.for_language(language::GO).strategy, runner_strategy::NATIVE);
    EXPECT_EQ(config.for_language(language::TYPESCRIPT).strategy, runner_strategy::SANDBOXED);
    EXPECT_EQ(config.for_language(language::TYPESCRIPT).sandbox_timeout_ms, 7000);
    EXPECT_EQ(config.for_language(language::GO).sandbox_timeout_ms, 12000);
    EXPECT_EQ(config.for_language(language::GO).native_timeout_ms, 15000);
}

TEST_F(ConfigTest, DevelopmentEnvironmentRunsNativelyTest) {
    set_env("NODE_ENV", "development");
    engine_config config = default_config();
    apply_env_config(config);
    for (auto &[lang, lang_config] : config.languages)
        EXPECT_EQ(lang_config.strategy, runner_strategy::NATIVE);

    set_env("EXECUTOR_STRATEGY", "sandboxed");
    config = default_config();
    apply_env_config(config);
    EXPECT_EQ(config.for_language(language::PHP).strategy, runner_strategy::SANDBOXED);
}

TEST_F(ConfigTest, InvalidEnvironmentValueTest) {
    set_env("WORKER_POOL_SIZE", "several");
    engine_config config = default_config();
    EXPECT_THROW(apply_env_config(config), invalid_argument);
}

TEST_F(ConfigTest, EffectiveTimeLimitTest) {
    language_config lang;
    EXPECT_EQ(lang.effective_time_limit(runner_strategy::SANDBOXED, 2000), 2000);
    lang.sandbox_timeout_ms = 10000;
    EXPECT_EQ(lang.effective_time_limit(runner_strategy::SANDBOXED, 2000), 10000);
    EXPECT_EQ(lang.effective_time_limit(runner_strategy::NATIVE, 2000), 2000);
    lang.native_timeout_ms = 15000;
    EXPECT_EQ(lang.effective_time_limit(runner_strategy::NATIVE, 2000), 15000);
}

TEST_F(ConfigTest, PrepareConfigCreatesRunDirectoryTest) {
    auto base = make_test_run_dir("prepare-config");
    engine_config config = default_config();
    config.run_dir = base / "nested" / "runs";
    EXPECT_NO_THROW(prepare_config(config));
    EXPECT_TRUE(std::filesystem::is_directory(config.run_dir));
}

TEST_F(ConfigTest, PrepareConfigRejectsBadValuesTest) {
    auto base = make_test_run_dir("prepare-config");
    write_file_content(base / "file", "not a directory");
    engine_config config = default_config();
    config.run_dir = base / "file" / "runs";
    EXPECT_THROW(prepare_config(config), invalid_argument);

    config.run_dir = base;
    config.workers = 0;
    EXPECT_THROW(prepare_config(config), invalid_argument);
}
