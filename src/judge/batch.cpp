#include "judge/batch.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <thread>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

json error_line(const string &kind, const string &message) {
    return {{"error", kind}, {"message", message}};
}

submission_output judge_submission(dispatcher &dispatcher, const engine_config &config, const json &j) {
    submission_output output;
    try {
        submission submit = parse_submission(j, config.default_time_limit_ms, config.default_memory_limit_mb);
        output.line = dispatcher.execute(submit);
    } catch (invalid_submission &e) {
        output.line = error_line("InvalidSubmission", e.what());
        output.exitcode = E_INVALID_SUBMISSION;
    } catch (overloaded &e) {
        output.line = error_line("Overloaded", e.what());
        output.exitcode = E_OVERLOADED;
    }
    return output;
}

vector<json> read_submissions(istream &in) {
    json j = json::parse(in);
    vector<json> submissions;
    if (j.is_array())
        for (auto &item : j) submissions.push_back(item);
    else
        submissions.push_back(move(j));
    return submissions;
}

int judge_batch(dispatcher &dispatcher, const engine_config &config, const vector<json> &submissions, ostream &out) {
    LOG(INFO) << "Judging " << submissions.size() << " submissions";

    vector<submission_output> outputs(submissions.size());
    vector<thread> threads;
    for (size_t i = 0; i < submissions.size(); ++i) {
        threads.emplace_back([&, i]() {
            outputs[i] = judge_submission(dispatcher, config, submissions[i]);
        });
    }
    for (auto &th : threads)
        th.join();

    int exitcode = E_SUCCESS;
    for (auto &output : outputs) {
        // 选手程序的输出不一定是合法的 UTF-8
        out << output.line.dump(-1, ' ', false, json::error_handler_t::replace) << endl;
        exitcode = max(exitcode, output.exitcode);
    }
    return exitcode;
}

}  // namespace codejudge
