#include "judge/dispatcher.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <optional>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "judge/result_parser.hpp"
#include "sandbox/execution_context.hpp"

namespace codejudge {
using namespace std;

static const char *SANDBOX_FAILURE_MESSAGE = "Internal execution error";

dispatcher::dispatcher(const engine_config &config, worker_pool &pool, adapter_table adapters, unique_ptr<strategy_selector> selector)
    : config(config), pool(pool), adapters(move(adapters)), selector(move(selector)) {}

dispatcher::dispatcher(const engine_config &config, worker_pool &pool)
    : dispatcher(config, pool, make_adapters(config), make_unique<strategy_selector>(config)) {}

void dispatcher::validate(const submission &submit) const {
    if (!adapters.count(submit.lang))
        throw invalid_submission(string("Unsupported language ") + language_name(submit.lang));
    if (submit.test_cases.empty())
        throw invalid_submission("Submission should contain at least one test case");
    if (!is_valid_identifier(submit.function_name))
        throw invalid_submission("Invalid function name " + submit.function_name);
    if (submit.time_limit_ms <= 0 || submit.time_limit_ms > config.max_time_limit_ms)
        throw invalid_submission("Time limit " + to_string(submit.time_limit_ms) + "ms is out of range (0, " + to_string(config.max_time_limit_ms) + "]");
    if (submit.memory_limit_mb <= 0 || submit.memory_limit_mb > config.max_memory_limit_mb)
        throw invalid_submission("Memory limit " + to_string(submit.memory_limit_mb) + "MB is out of range (0, " + to_string(config.max_memory_limit_mb) + "]");
}

execution_report dispatcher::execute(const submission &submit) {
    try {
        validate(submit);
    } catch (invalid_submission &e) {
        LOG(INFO) << "Rejected " << submit << ": " << e.what();
        throw;
    }

    const language_adapter &adapter = *adapters.at(submit.lang);
    worker_pool::slot slot = pool.acquire(chrono::milliseconds(config.queue_timeout_ms));
    LOG(INFO) << "Accepted " << submit << ", " << pool.available() << " of " << pool.capacity() << " worker slots left";

    elapsed_time timer;
    execution_report report;
    int time_limit_ms = submit.time_limit_ms;
    {
        // 评测上下文在槽位之后构造，因此一定在归还槽位之前销毁
        optional<execution_context> ctx;
        try {
            ctx.emplace(config.run_dir, DEBUG);
            runnable_artifact artifact = adapter.prepare(submit, ctx->artifact_dir());
            sandbox_runner &runner = selector->select(adapter, artifact);

            time_limit_ms = adapter.config().effective_time_limit(runner.strategy(), submit.time_limit_ms);
            resource_limits limits;
            limits.time_limit_ms = time_limit_ms;
            limits.memory_limit_mb = submit.memory_limit_mb;
            limits.cpu_quota = config.cpu_quota;
            limits.output_limit = config.output_limit;
            auto deadline = chrono::steady_clock::now() + chrono::milliseconds(time_limit_ms + config.grace_ms);

            raw_execution_output raw = runner.run(*ctx, artifact, limits, deadline);
            parsed_result parsed = result_parser(adapter, config.error_limit).parse(raw, submit.test_cases, time_limit_ms);
            report.results = move(parsed.results);
            report.result = parsed.result;
        } catch (sandbox_error &e) {
            LOG(ERROR) << "Sandbox failure while executing " << submit << ": " << e;
            parsed_result failed = fail_all(submit.test_cases, outcome::SANDBOX_ERROR, SANDBOX_FAILURE_MESSAGE, 0);
            report.results = move(failed.results);
            report.result = failed.result;
        } catch (exception &e) {
            LOG(ERROR) << "Internal error while executing " << submit << ": " << boost::diagnostic_information(e);
            parsed_result failed = fail_all(submit.test_cases, outcome::SANDBOX_ERROR, SANDBOX_FAILURE_MESSAGE, 0);
            report.results = move(failed.results);
            report.result = failed.result;
        }

        if (ctx && !ctx->torn_down()) {
            try {
                ctx->teardown();
            } catch (sandbox_error &e) {
                LOG(ERROR) << "Teardown failure while executing " << submit << ": " << e;
                parsed_result failed = fail_all(submit.test_cases, outcome::SANDBOX_ERROR, SANDBOX_FAILURE_MESSAGE, 0);
                report.results = move(failed.results);
                report.result = failed.result;
            }
        }
    }
    report.total_time_ms = timer.milliseconds();
    slot.release();

    LOG(INFO) << "Finished " << submit << " with " << get_display_message(report.result) << ", "
              << report.passed_tests() << "/" << report.results.size() << " passed in " << report.total_time_ms << "ms";
    return report;
}

}  // namespace codejudge
