#include "judge/report.hpp"
#include <algorithm>

namespace codejudge {
using namespace std;
using namespace nlohmann;

size_t execution_report::passed_tests() const {
    return count_if(results.begin(), results.end(), [](const test_result &r) { return r.passed; });
}

bool execution_report::success() const {
    return result == outcome::COMPLETED && !results.empty() && passed_tests() == results.size();
}

void to_json(json &j, const test_result &result) {
    j = {{"passed", result.passed},
         {"expected", result.expected},
         {"description", result.description},
         {"executionTimeMs", result.execution_time_ms}};
    if (result.actual) j["actual"] = *result.actual;
    if (result.error) j["error"] = *result.error;
}

void to_json(json &j, const execution_report &report) {
    j = {{"results", report.results},
         {"totalTimeMs", report.total_time_ms},
         {"outcome", get_display_message(report.result)},
         {"passedTests", report.passed_tests()},
         {"totalTests", report.results.size()},
         {"success", report.success()}};
}

}  // namespace codejudge
