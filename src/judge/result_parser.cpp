#include "judge/result_parser.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "judge/language.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

result_parser::result_parser(vector<string> markers, size_t error_limit)
    : markers(move(markers)), error_limit(error_limit) {}

result_parser::result_parser(const language_adapter &adapter, size_t error_limit)
    : markers(adapter.compile_error_markers()), error_limit(error_limit), adapter(&adapter) {}

string last_non_empty_line(const string &text) {
    size_t end = text.size();
    while (end > 0) {
        size_t begin = text.rfind('\n', end - 1);
        begin = begin == string::npos ? 0 : begin + 1;
        string line = boost::algorithm::trim_copy(text.substr(begin, end - begin));
        if (!line.empty()) return line;
        if (begin == 0) break;
        end = begin - 1;
    }
    return "";
}

bool result_parser::is_compile_error(const string &stderr_text) const {
    for (auto &marker : markers)
        if (stderr_text.find(marker) != string::npos) return true;
    return false;
}

parsed_result fail_all(const vector<test_case> &test_cases, outcome result, const string &error,
                       double time_per_test) {
    parsed_result parsed;
    parsed.result = result;
    for (auto &testcase : test_cases) {
        test_result r;
        r.passed = false;
        r.expected = testcase.expected;
        r.error = error;
        r.description = testcase.description;
        r.execution_time_ms = time_per_test;
        parsed.results.push_back(move(r));
    }
    return parsed;
}

parsed_result result_parser::parse(const raw_execution_output &raw, const vector<test_case> &test_cases, int time_limit_ms) const {
    if (test_cases.empty())
        throw invalid_argument("Test cases should not be empty");
    double time_per_test = raw.wall_time_ms / test_cases.size();

    if (raw.timed_out)
        return fail_all(test_cases, outcome::TIMEOUT, fmt::format("Execution timed out after {}ms", time_limit_ms), time_per_test);

    json output;
    bool is_json = false;
    string line = last_non_empty_line(raw.stdout_text);
    if (!line.empty()) {
        try {
            output = json::parse(line);
            is_json = true;
        } catch (json::parse_error &) {
            is_json = false;
        }
    }

    // 选手程序调试输出的 JSON（比如一个数字）不是评测脚本的结果
    bool is_harness_line = is_json && output.is_array() &&
                           all_of(output.begin(), output.end(), [](const json &item) { return item.is_object(); });

    if (!is_harness_line && raw.exit_code != 0) {
        string diagnostics = raw.stderr_text.empty() ? raw.stdout_text : raw.stderr_text;
        if (is_compile_error(diagnostics)) {
            string message = adapter ? adapter->describe_compile_error(diagnostics) : diagnostics;
            return fail_all(test_cases, outcome::COMPILE_ERROR, truncate_message(message, error_limit), time_per_test);
        }
        if (diagnostics.empty())
            diagnostics = fmt::format("Process exited with code {}", raw.exit_code);
        return fail_all(test_cases, outcome::RUNTIME_ERROR, truncate_message(diagnostics, error_limit), time_per_test);
    }

    if (!is_json || !output.is_array() || output.size() != test_cases.size()) {
        if (!is_json)
            LOG(ERROR) << "Harness produced no JSON result line (exit code " << raw.exit_code << "), stderr: "
                       << truncate_message(raw.stderr_text, error_limit);
        else if (!output.is_array())
            LOG(ERROR) << "Harness result is not an array: " << truncate_message(line, error_limit);
        else
            LOG(ERROR) << "Harness reported " << output.size() << " results for " << test_cases.size() << " test cases";
        return fail_all(test_cases, outcome::SANDBOX_ERROR, "Internal execution error", time_per_test);
    }

    parsed_result parsed;
    parsed.result = outcome::COMPLETED;
    for (size_t i = 0; i < test_cases.size(); ++i) {
        const json &item = output[i];
        if (!item.is_object()) {
            LOG(ERROR) << "Harness result " << i << " is not an object: " << item.dump();
            return fail_all(test_cases, outcome::SANDBOX_ERROR, "Internal execution error", time_per_test);
        }

        test_result r;
        r.expected = test_cases[i].expected;
        r.description = test_cases[i].description;
        auto passed_it = item.find("passed");
        r.passed = passed_it != item.end() && passed_it->is_boolean() && passed_it->get<bool>();
        if (item.contains("actual")) r.actual = item.at("actual");
        if (item.contains("error") && !item.at("error").is_null()) {
            const json &error = item.at("error");
            r.error = truncate_message(error.is_string() ? error.get<string>() : error.dump(), error_limit);
        }
        auto time_it = item.find("executionTimeMs");
        r.execution_time_ms = time_it != item.end() && time_it->is_number() ? time_it->get<double>() : time_per_test;
        parsed.results.push_back(move(r));
    }
    return parsed;
}

}  // namespace codejudge
