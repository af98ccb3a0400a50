#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

filesystem::path find_executable(const string &program) {
    if (program.empty()) return {};
    if (program.find('/') != string::npos)
        return access(program.c_str(), X_OK) == 0 ? filesystem::path(program) : filesystem::path();

    vector<string> dirs;
    boost::split(dirs, get_env("PATH", "/usr/local/bin:/usr/bin:/bin"), boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        filesystem::path candidate = filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0 && !filesystem::is_directory(candidate))
            return candidate;
    }
    return {};
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::milliseconds() const {
    return chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
}
