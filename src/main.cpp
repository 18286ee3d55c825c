#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <future>
#include <iostream>
#include <optional>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/report.hpp"
#include "monitor/log_monitor.hpp"
#include "sandbox/go_judge.hpp"
#include "worker.hpp"
using namespace std;
namespace po = boost::program_options;

/**
 * @brief 依次从命令行参数、环境变量中读取配置，都不存在时保持默认值
 */
template <typename T>
static void load_option(const po::variables_map& vm, const char* option, const char* env, T& value) {
    if (vm.count(option)) {
        value = vm.at(option).as<T>();
    } else if (getenv(env)) {
        try {
            value = boost::lexical_cast<T>(getenv(env));
        } catch (boost::bad_lexical_cast&) {
            LOG(FATAL) << "Environment variable " << env << " has malformed value " << getenv(env);
        }
    }
}

static arbiter::worker_options make_worker_options() {
    arbiter::worker_options options;
    options.workers = arbiter::JUDGE_WORKERS;
    options.parallelism = arbiter::GJ_PARALLELISM;
    options.sandbox_retries = arbiter::SANDBOX_RETRIES;
    options.submission_timeout = chrono::milliseconds(arbiter::SUBMISSION_TIMEOUT);
    options.pipeline.output_limit = arbiter::OUTPUT_LIMIT;
    options.pipeline.stderr_limit = arbiter::STDERR_LIMIT;
    options.pipeline.proc_limit = arbiter::PROC_LIMIT;
    options.pipeline.checker.include_dir = arbiter::CHECKER_INCLUDE_DIR.string();
    options.pipeline.checker.time_limit = chrono::milliseconds(arbiter::CHECKER_TIME_LIMIT);
    options.pipeline.checker.memory_limit = arbiter::CHECKER_MEM_LIMIT;
    options.pipeline.checker.output_limit = arbiter::STDERR_LIMIT;
    return options;
}

struct pending_report {
    string id;
    optional<nlohmann::json> report;
    future<arbiter::submission_verdict> result;
};

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    po::options_description desc("arbiter options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("workers", po::value<size_t>(), "set the number of submissions judged at the same time, default to 4. You can either pass it from environ JUDGE_WORKERS")
        ("parallelism", po::value<size_t>(), "set the number of concurrent sandbox calls, no more than workers, default to 4. You can either pass it from environ GJ_PARALLELISM")
        ("sandbox-url", po::value<string>(), "set the address of go-judge, default to http://localhost:5050. You can either pass it from environ SANDBOX_URL")
        ("sandbox-retries", po::value<int>(), "set the number of retries of an unavailable sandbox call, default to 2. You can either pass it from environ SANDBOX_RETRIES")
        ("sandbox-guard-time", po::value<int>(), "set the milliseconds waited beyond the wall time limit before the sandbox is considered unresponsive, default to 2000. You can either pass it from environ SANDBOX_GUARD_TIME")
        ("submission-timeout", po::value<int>(), "set the milliseconds a submission may take from admission to completion, 0 for unlimited, default to 300000. You can either pass it from environ SUBMISSION_TIMEOUT")
        ("checker-include-dir", po::value<string>(), "set the directory of checker headers visible in the sandbox, default to /lib/testlib. You can either pass it from environ CHECKER_INCLUDE_DIR")
        ("checker-time-limit", po::value<int>(), "set time limit in milliseconds for checkers, default to 10000. You can either pass it from environ CHECKER_TIME_LIMIT")
        ("checker-mem-limit", po::value<uint64_t>(), "set memory limit in bytes for checkers, default to 536870912(512MB). You can either pass it from environ CHECKER_MEM_LIMIT")
        ("output-limit", po::value<uint64_t>(), "set the stdout limit in bytes of user programs, default to 67108864(64MB). You can either pass it from environ OUTPUT_LIMIT")
        ("stderr-limit", po::value<uint64_t>(), "set the stderr and compiler output limit in bytes, default to 65536(64KB). You can either pass it from environ STDERR_LIMIT")
        ("proc-limit", po::value<int>(), "set the process limit of user programs, default to 64. You can either pass it from environ PROC_LIMIT")
        ("languages", po::value<string>(), "load per-language compile/run overrides from the given JSON file")
        ("submission", po::value<vector<string>>(), "submission JSON files, each holding a submission object or an array of them")
        ("debug", "turn on the debug mode to log the detail of every test case")
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
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "arbiter: compile and judge submissions in go-judge" << endl
             << "Usage: " << argv[0] << " [options] <submission.json>..." << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arbiter 1.0" << endl;
        return EXIT_SUCCESS;
    }

    // 调试模式下输出每个测试点的详细信息（VLOG(1)）
    if (vm.count("debug") || getenv("DEBUG")) FLAGS_v = 1;

    load_option(vm, "workers", "JUDGE_WORKERS", arbiter::JUDGE_WORKERS);
    load_option(vm, "parallelism", "GJ_PARALLELISM", arbiter::GJ_PARALLELISM);
    load_option(vm, "sandbox-url", "SANDBOX_URL", arbiter::SANDBOX_URL);
    load_option(vm, "sandbox-retries", "SANDBOX_RETRIES", arbiter::SANDBOX_RETRIES);
    load_option(vm, "sandbox-guard-time", "SANDBOX_GUARD_TIME", arbiter::SANDBOX_GUARD_TIME);
    load_option(vm, "submission-timeout", "SUBMISSION_TIMEOUT", arbiter::SUBMISSION_TIMEOUT);
    load_option(vm, "checker-time-limit", "CHECKER_TIME_LIMIT", arbiter::CHECKER_TIME_LIMIT);
    load_option(vm, "checker-mem-limit", "CHECKER_MEM_LIMIT", arbiter::CHECKER_MEM_LIMIT);
    load_option(vm, "output-limit", "OUTPUT_LIMIT", arbiter::OUTPUT_LIMIT);
    load_option(vm, "stderr-limit", "STDERR_LIMIT", arbiter::STDERR_LIMIT);
    load_option(vm, "proc-limit", "PROC_LIMIT", arbiter::PROC_LIMIT);

    string checker_include_dir = arbiter::CHECKER_INCLUDE_DIR.string();
    load_option(vm, "checker-include-dir", "CHECKER_INCLUDE_DIR", checker_include_dir);
    arbiter::CHECKER_INCLUDE_DIR = checker_include_dir;

    CHECK(arbiter::JUDGE_WORKERS > 0) << "At least one worker is required";
    CHECK(arbiter::GJ_PARALLELISM > 0) << "Sandbox parallelism should be positive";
    CHECK(!arbiter::SANDBOX_URL.empty()) << "Sandbox address should be specified";

    nlohmann::json overrides;
    if (vm.count("languages")) {
        string path = vm.at("languages").as<string>();
        try {
            overrides = nlohmann::json::parse(arbiter::read_file_content(path));
        } catch (std::exception& e) {
            LOG(FATAL) << "Language configuration file " << path << " is malformed: " << e.what();
        }
    }

    optional<arbiter::language_registry> registry;
    try {
        registry.emplace(arbiter::language_registry::load(overrides));
    } catch (std::exception& e) {
        LOG(FATAL) << "Invalid language configuration: " << e.what();
    }

    curl_global_init(CURL_GLOBAL_ALL);
    defer { curl_global_cleanup(); };

    arbiter::sandbox::go_judge engine(arbiter::SANDBOX_URL, chrono::milliseconds(arbiter::SANDBOX_GUARD_TIME));
    arbiter::worker_pool pool(*registry, engine, make_worker_options());
    pool.register_monitor(make_unique<arbiter::log_monitor>());
    pool.start();

    vector<pending_report> reports;
    vector<string> files;
    if (vm.count("submission")) files = vm.at("submission").as<vector<string>>();
    for (auto& file : files) {
        vector<nlohmann::json> submissions;
        try {
            submissions = arbiter::split_submissions(nlohmann::json::parse(arbiter::read_file_content(file)));
        } catch (std::exception& e) {
            pending_report entry;
            entry.id = file;
            entry.report = arbiter::client_error_report(file, e.what());
            reports.push_back(move(entry));
            continue;
        }

        for (size_t i = 0; i < submissions.size(); ++i) {
            pending_report entry;
            auto& j = submissions[i];
            entry.id = j.is_object() && j.contains("id") && j["id"].is_string()
                           ? j["id"].get<string>()
                           : file + "#" + to_string(i);
            try {
                entry.result = pool.submit(arbiter::parse_submission(j));
            } catch (arbiter::client_error& e) {
                entry.report = arbiter::client_error_report(entry.id, e.what());
            } catch (arbiter::infrastructure_error& e) {
                entry.report = arbiter::infrastructure_error_report(entry.id, e.what());
            }
            reports.push_back(move(entry));
        }
    }

    nlohmann::json output = nlohmann::json::array();
    for (auto& entry : reports) {
        if (!entry.report) {
            try {
                entry.report = arbiter::judged_report(entry.id, entry.result.get());
            } catch (arbiter::infrastructure_error& e) {
                entry.report = arbiter::infrastructure_error_report(entry.id, e.what());
            } catch (std::exception& e) {
                LOG(ERROR) << "Unexpected failure of " << entry.id << endl
                           << boost::diagnostic_information(e);
                entry.report = arbiter::infrastructure_error_report(entry.id, e.what());
            }
        }
        output.push_back(*entry.report);
    }

    pool.stop();
    cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    return EXIT_SUCCESS;
}
