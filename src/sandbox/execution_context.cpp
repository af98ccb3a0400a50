#include "sandbox/execution_context.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

static string generate_uuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

execution_context::execution_context(const fs::path &run_dir, bool keep_artifacts)
    : uuid(generate_uuid()), dir(run_dir / ("exec-" + uuid)), keep_artifacts(keep_artifacts) {
    fs::create_directories(dir);
    LOG(INFO) << "Created execution context " << uuid << " at " << dir;
}

execution_context::~execution_context() {
    teardown_nothrow();
}

const string &execution_context::id() const {
    return uuid;
}

const fs::path &execution_context::artifact_dir() const {
    return dir;
}

string execution_context::unit_name() const {
    return "codejudge-" + uuid;
}

void execution_context::register_unit(const string &name, function<void()> teardown) {
    units.emplace_back(name, move(teardown));
}

void execution_context::teardown() {
    if (finished) return;
    finished = true;

    vector<string> failures;
    while (!units.empty()) {
        auto [name, unit_teardown] = move(units.back());
        units.pop_back();
        try {
            unit_teardown();
        } catch (exception &e) {
            LOG(ERROR) << "Unable to tear down " << name << " of execution context " << uuid << ": " << boost::diagnostic_information(e);
            failures.push_back(name + ": " + e.what());
        }
    }

    if (keep_artifacts) {
        LOG(INFO) << "Keeping artifacts of execution context " << uuid << " at " << dir;
    } else {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            LOG(ERROR) << "Unable to remove artifact directory " << dir << ": " << ec.message();
            failures.push_back(dir.string() + ": " + ec.message());
        }
    }

    LOG(INFO) << "Execution context " << uuid << " torn down";
    if (!failures.empty())
        throw sandbox_error("Teardown of execution context " + uuid + " failed: " + failures.front());
}

void execution_context::teardown_nothrow() noexcept {
    try {
        teardown();
    } catch (sandbox_error &e) {
        LOG(ERROR) << e;
    }
}

bool execution_context::torn_down() const {
    return finished;
}

}  // namespace codejudge
