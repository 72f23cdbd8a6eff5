#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/language.hpp"
#include "judge/orchestrator.hpp"
#include "server/local_store.hpp"
#include "worker.hpp"
using namespace std;
namespace po = boost::program_options;
namespace fs = std::filesystem;

void sigint_handler(int /* signum */) {
    grader::stop_workers();
}

/**
 * @brief 优先使用命令行参数，其次是环境变量，最后是默认值
 */
template <typename T>
T option_or_env(const po::variables_map &vm, const char *option, const char *env, const T &def_value) {
    if (vm.count(option)) return vm.at(option).as<T>();
    if (getenv(env)) return boost::lexical_cast<T>(getenv(env));
    return def_value;
}

/**
 * @brief 展开 --submission 参数，目录会被展开为其中所有的 .json 文件
 */
vector<fs::path> collect_submissions(const vector<string> &args) {
    vector<fs::path> files;
    for (auto &arg : args) {
        fs::path path(arg);
        if (fs::is_directory(path)) {
            vector<fs::path> entries;
            for (auto &p : fs::directory_iterator(path))
                if (fs::is_regular_file(p) && p.path().extension() == ".json")
                    entries.push_back(p.path());
            sort(entries.begin(), entries.end());
            files.insert(files.end(), entries.begin(), entries.end());
        } else {
            CHECK(fs::is_regular_file(path))
                << "Submission file " << path << " does not exist";
            files.push_back(path);
        }
    }
    return files;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigint_handler);

    po::options_description desc("grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("problem-dir", po::value<string>(), "set the directory containing problem configurations <problem id>.json. You can either pass it from environ PROBLEMDIR")
        ("submission", po::value<vector<string>>(), "submission file to judge, or a directory of submission files with extension .json. Can be repeated")
        ("output-dir", po::value<string>(), "set the directory to write status and results <submission id>.json, default to ./results. You can either pass it from environ OUTPUTDIR")
        ("run-dir", po::value<string>(), "set the directory to run user programs, store compiled user program. You can either pass it from environ RUNDIR")
        ("workers", po::value<size_t>(), "set the number of submissions judged concurrently, default to 1. You can either pass it from environ WORKERS")
        ("test-workers", po::value<size_t>(), "set the number of test cases of one submission run concurrently, default to 1. You can either pass it from environ TESTWORKERS")
        ("languages", po::value<string>(), "load additional language configurations from a JSON file. You can either pass it from environ LANGUAGES")
        ("grace-period", po::value<double>(), "set the seconds to wait after time limit before killing user programs, default to 1. You can either pass it from environ GRACEPERIOD")
        ("output-limit", po::value<size_t>(), "set the maximum bytes of standard output kept for user programs, default to 67108864(64MB). You can either pass it from environ OUTPUTLIMIT")
        ("use-cgroup", "limit memory and account memory usage with cgroup, requires root privilege")
        ("no-seccomp", "do not load the seccomp filter for user programs")
        ("debug", "turn on the debug mode not to delete submission directory to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "grader: judge submissions against problem test cases" << endl
             << "Usage: " << argv[0] << " --problem-dir <dir> --submission <file or dir> [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "grader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        grader::DEBUG = true;
    }

    fs::path problem_dir, output_dir;
    size_t workers;
    string languages_file;
    try {
        grader::RUN_DIR = option_or_env<string>(vm, "run-dir", "RUNDIR", grader::RUN_DIR.string());
        problem_dir = option_or_env<string>(vm, "problem-dir", "PROBLEMDIR", "");
        output_dir = option_or_env<string>(vm, "output-dir", "OUTPUTDIR", "results");
        workers = option_or_env<size_t>(vm, "workers", "WORKERS", 1);
        grader::TEST_WORKERS = option_or_env<size_t>(vm, "test-workers", "TESTWORKERS", grader::TEST_WORKERS);
        grader::GRACE_PERIOD = option_or_env<double>(vm, "grace-period", "GRACEPERIOD", grader::GRACE_PERIOD);
        grader::OUTPUT_LIMIT = option_or_env<size_t>(vm, "output-limit", "OUTPUTLIMIT", grader::OUTPUT_LIMIT);
        languages_file = option_or_env<string>(vm, "languages", "LANGUAGES", "");
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Invalid environment variable: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    grader::USE_CGROUP = vm.count("use-cgroup") || getenv("USECGROUP");
    grader::USE_SECCOMP = !vm.count("no-seccomp");

    if (grader::USE_CGROUP && getuid() != 0) {
        cerr << "You should run this program in privileged mode to use cgroup" << endl;
        return EXIT_FAILURE;
    }

    CHECK(!problem_dir.empty())
        << "Problem directory should be specified by --problem-dir or PROBLEMDIR";
    CHECK(fs::is_directory(problem_dir))
        << "Problem directory " << problem_dir << " does not exist";
    CHECK(workers > 0) << "At least one worker is required";
    CHECK(grader::GRACE_PERIOD >= 0) << "Grace period should not be negative";

    error_code ec;
    fs::create_directories(grader::RUN_DIR, ec);
    CHECK(fs::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";

    if (!vm.count("submission")) {
        cerr << "No submission specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }
    vector<fs::path> files = collect_submissions(vm.at("submission").as<vector<string>>());

    grader::language_registry languages = grader::language_registry::defaults();
    try {
        if (!languages_file.empty()) languages.load(languages_file);
    } catch (grader::configuration_error &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    grader::server::local_problem_store problems(problem_dir);
    grader::server::local_submission_store results(output_dir);
    grader::judging_orchestrator orchestrator(results, languages);

    grader::concurrent_queue<fs::path> submission_queue;
    for (auto &file : files) submission_queue.push(file);
    submission_queue.close();

    grader::worker_stats stats;
    vector<thread> threads;
    for (size_t i = 0; i < min(workers, files.size()); ++i)
        threads.push_back(grader::start_worker(i, submission_queue, orchestrator, problems, stats));
    for (auto &worker : threads) worker.join();

    size_t judged = stats.judged, rejected = stats.rejected;
    LOG(INFO) << "Judged " << judged << " submissions, " << rejected << " rejected, "
              << files.size() - judged - rejected << " skipped";
    return rejected == 0 && judged == files.size() ? EXIT_SUCCESS : EXIT_FAILURE;
}
