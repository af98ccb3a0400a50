#include "common/outcome.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::COMPLETED, "Completed")
    (outcome::COMPILE_ERROR, "CompileError")
    (outcome::RUNTIME_ERROR, "RuntimeError")
    (outcome::TIMEOUT, "Timeout")
    (outcome::SANDBOX_ERROR, "SandboxError");
// clang-format on

const char *get_display_message(outcome value) {
    return outcome_string.at(value);
}

outcome parse_outcome(const string &name) {
    for (auto &[value, display] : outcome_string)
        if (name == display) return value;
    throw invalid_argument("Unrecognized outcome " + name);
}

}  // namespace codejudge
