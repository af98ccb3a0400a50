#include "judge/submission.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

const char *language_name(language lang) {
    switch (lang) {
        case language::TYPESCRIPT:
            return "typescript";
        case language::GO:
            return "go";
        case language::PHP:
            return "php";
    }
    return "unknown";
}

language parse_language(const string &name) {
    string lower = boost::algorithm::to_lower_copy(name);
    if (lower == "typescript" || lower == "ts" || lower == "javascript" || lower == "js")
        return language::TYPESCRIPT;
    else if (lower == "go" || lower == "golang")
        return language::GO;
    else if (lower == "php")
        return language::PHP;
    else
        throw invalid_submission("Unsupported language " + name);
}

bool is_valid_identifier(const string &name) {
    if (name.empty()) return false;
    if (!isalpha((unsigned char)name[0]) && name[0] != '_') return false;
    for (char c : name)
        if (!isalnum((unsigned char)c) && c != '_') return false;
    return true;
}

submission parse_submission(const json &j, int default_time_limit_ms, int default_memory_limit_mb) {
    submission submit;
    try {
        submit.source_code = get_value<string>(j, "sourceCode");
        submit.lang = parse_language(get_value<string>(j, "language"));
        submit.function_name = get_value<string>(j, "functionName");
        submit.time_limit_ms = get_value_def<int>(j, default_time_limit_ms, "timeLimitMs");
        submit.memory_limit_mb = get_value_def<int>(j, default_memory_limit_mb, "memoryLimitMb");

        const json &test_cases = access(j, "testCases");
        if (!test_cases.is_array())
            throw invalid_submission("testCases should be an array");
        for (auto &item : test_cases) {
            test_case testcase;
            testcase.input = access(item, "input");
            testcase.expected = item.contains("expected") ? item.at("expected") : json();
            testcase.description = get_value_def<string>(item, "", "description");
            submit.test_cases.push_back(move(testcase));
        }
    } catch (invalid_argument &e) {
        throw invalid_submission(e.what());
    }
    return submit;
}

json test_cases_to_json(const vector<test_case> &test_cases) {
    json result = json::array();
    for (auto &testcase : test_cases) {
        result.push_back({{"input", testcase.input},
                          {"expected", testcase.expected},
                          {"description", testcase.description}});
    }
    return result;
}

ostream &operator<<(ostream &os, const submission &submit) {
    os << "Submission[" << language_name(submit.lang) << ":" << submit.function_name
       << ", " << submit.test_cases.size() << " test cases, "
       << submit.time_limit_ms << "ms, " << submit.memory_limit_mb << "MB]";
    return os;
}

}  // namespace codejudge
