#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judge/strategy_selector.hpp"
#include "test/shell_adapter.hpp"

using namespace std;
using namespace codejudge;
using ::testing::_;
using ::testing::Return;

class mock_runner : public sandbox_runner {
public:
    MOCK_METHOD(runner_strategy, strategy, (), (const, override));
    MOCK_METHOD(bool, is_available, (const runnable_artifact &), (const, override));
    MOCK_METHOD(raw_execution_output, execute,
                (execution_context &, const runnable_artifact &, const resource_limits &, std::chrono::steady_clock::time_point),
                (override));
};

class StrategySelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto native_mock = make_unique<mock_runner>();
        auto sandboxed_mock = make_unique<mock_runner>();
        native = native_mock.get();
        sandboxed = sandboxed_mock.get();
        ON_CALL(*native, strategy()).WillByDefault(Return(runner_strategy::NATIVE));
        ON_CALL(*sandboxed, strategy()).WillByDefault(Return(runner_strategy::SANDBOXED));
        selector = make_unique<strategy_selector>(move(native_mock), move(sandboxed_mock));
        artifact.toolchain = "go";
    }

    language_config configured(runner_strategy strategy) {
        language_config config;
        config.strategy = strategy;
        return config;
    }

    mock_runner *native;
    mock_runner *sandboxed;
    unique_ptr<strategy_selector> selector;
    runnable_artifact artifact;
};

TEST_F(StrategySelectorTest, SandboxedLanguageUsesContainerTest) {
    shell_adapter adapter(configured(runner_strategy::SANDBOXED));
    EXPECT_CALL(*native, is_available(_)).Times(0);
    EXPECT_EQ(&selector->select(adapter, artifact), sandboxed);
}

TEST_F(StrategySelectorTest, NativeLanguageWithToolchainRunsNativelyTest) {
    shell_adapter adapter(configured(runner_strategy::NATIVE));
    EXPECT_CALL(*native, is_available(_)).WillOnce(Return(true));
    EXPECT_EQ(&selector->select(adapter, artifact), native);
}

TEST_F(StrategySelectorTest, MissingToolchainFallsBackToSandboxTest) {
    shell_adapter adapter(configured(runner_strategy::NATIVE));
    EXPECT_CALL(*native, is_available(_)).WillOnce(Return(false));
    EXPECT_EQ(&selector->select(adapter, artifact), sandboxed);
}
