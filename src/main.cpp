#include <glog/logging.h>
#include <sys/stat.h>
#include <boost/program_options.hpp>
#include <iostream>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/batch.hpp"
#include "judge/dispatcher.hpp"
#include "judge/worker_pool.hpp"
using namespace std;
using codejudge::E_FAILURE;
using codejudge::E_INVALID_SUBMISSION;
using codejudge::E_SUCCESS;

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("submission", po::value<vector<string>>(), "submission JSON files to judge. If none is given, read submissions from stdin.")
        ("config", po::value<string>(), "load configuration from JSON file, applied before environment variables and command line options")
        ("run-dir", po::value<string>(), "set the directory to store per-run artifacts. You can either pass it from environ RUNNER_TEMP_DIR")
        ("workers", po::value<size_t>(), "set the capacity of worker pool, default to hardware concurrency. You can either pass it from environ WORKER_POOL_SIZE")
        ("queue-timeout", po::value<int>(), "set the time in milliseconds to wait for a free worker slot, default to 30000. You can either pass it from environ QUEUE_TIMEOUT_MS")
        ("strategy", po::value<string>(), "set the executor strategy for every language, native or sandboxed. You can either pass it from environ EXECUTOR_STRATEGY")
        ("native-go", "run Go submissions natively. You can either pass it from environ USE_NATIVE_GO_EXECUTOR")
        ("sandbox-timeout", po::value<int>(), "override time limit in milliseconds for sandboxed execution. You can either pass it from environ DOCKER_TIMEOUT")
        ("native-timeout", po::value<int>(), "override time limit in milliseconds for native Go execution. You can either pass it from environ NATIVE_GO_TIMEOUT")
        ("memory-limit", po::value<string>(), "set default memory limit of submissions, such as 128m. You can either pass it from environ DOCKER_MEMORY_LIMIT")
        ("cpu-quota", po::value<long>(), "set CPU quota of containers, 100000 for one CPU. You can either pass it from environ DOCKER_CPU_QUOTA")
        ("max-time-limit", po::value<int>(), "set the maximum time limit in milliseconds a submission may request, default to 60000")
        ("max-memory-limit", po::value<int>(), "set the maximum memory limit in MB a submission may request, default to 1024")
        ("grace", po::value<int>(), "set the extra time in milliseconds the host waits beyond time limit, default to 2000")
        ("container-runtime", po::value<string>(), "set the container runtime binary, default to docker. You can either pass it from environ CONTAINER_RUNTIME")
        ("debug", "turn on the debug mode to keep artifact directories for inspection. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("submission", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: Execute submissions against their test cases and print one report per line" << endl
             << "Usage: " << argv[0] << " [options] [submission.json...]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge 1.0" << endl;
        return E_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        codejudge::DEBUG = true;
    }

    codejudge::engine_config config = codejudge::default_config();
    try {
        if (vm.count("config")) {
            filesystem::path config_file = vm["config"].as<string>();
            if (!filesystem::is_regular_file(config_file))
                throw invalid_argument("Configuration file " + config_file.string() + " does not exist");
            codejudge::apply_json_config(config, nlohmann::json::parse(codejudge::read_file_content(config_file)));
        }
        codejudge::apply_env_config(config);

        if (vm.count("run-dir")) config.run_dir = vm["run-dir"].as<string>();
        if (vm.count("workers")) config.workers = vm["workers"].as<size_t>();
        if (vm.count("queue-timeout")) config.queue_timeout_ms = vm["queue-timeout"].as<int>();
        if (vm.count("strategy")) codejudge::set_all_strategies(config, codejudge::parse_strategy(vm["strategy"].as<string>()));
        if (vm.count("native-go")) config.languages[codejudge::language::GO].strategy = codejudge::runner_strategy::NATIVE;
        if (vm.count("sandbox-timeout")) {
            for (auto& [lang, lang_config] : config.languages)
                lang_config.sandbox_timeout_ms = vm["sandbox-timeout"].as<int>();
        }
        if (vm.count("native-timeout")) config.languages[codejudge::language::GO].native_timeout_ms = vm["native-timeout"].as<int>();
        if (vm.count("memory-limit")) config.default_memory_limit_mb = codejudge::parse_memory_size_mb(vm["memory-limit"].as<string>());
        if (vm.count("cpu-quota")) config.cpu_quota = vm["cpu-quota"].as<long>();
        if (vm.count("max-time-limit")) config.max_time_limit_ms = vm["max-time-limit"].as<int>();
        if (vm.count("max-memory-limit")) config.max_memory_limit_mb = vm["max-memory-limit"].as<int>();
        if (vm.count("grace")) config.grace_ms = vm["grace"].as<int>();
        if (vm.count("container-runtime")) config.container_runtime = vm["container-runtime"].as<string>();

        codejudge::prepare_config(config);
    } catch (std::exception& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return E_FAILURE;
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    for (auto& [lang, lang_config] : config.languages)
        LOG(INFO) << "Language " << codejudge::language_name(lang) << " uses " << codejudge::strategy_name(lang_config.strategy)
                  << " executor with image " << lang_config.image;

    vector<nlohmann::json> submissions;
    try {
        if (vm.count("submission")) {
            for (auto& file : vm["submission"].as<vector<string>>())
                submissions.push_back(nlohmann::json::parse(codejudge::read_file_content(file)));
        } else {
            submissions = codejudge::read_submissions(cin);
        }
    } catch (nlohmann::json::exception& e) {
        cout << codejudge::error_line("InvalidSubmission", e.what()) << endl;
        return E_INVALID_SUBMISSION;
    }

    codejudge::worker_pool pool(config.workers);
    codejudge::dispatcher dispatcher(config, pool);

    return codejudge::judge_batch(dispatcher, config, submissions, cout);
}
