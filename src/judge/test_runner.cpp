#include "judge/test_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <atomic>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

string normalize_output(const string &text) {
    string result;
    istringstream stream(text);
    string line;
    while (getline(stream, line)) {
        size_t end = line.find_last_not_of(" \t\r\v\f");
        if (end == string::npos) continue;  // blank line
        if (!result.empty()) result += '\n';
        result.append(line, 0, end + 1);
    }
    return result;
}

test_runner::test_runner(const fs::path &work_dir, size_t workers)
    : work_dir(work_dir), workers(max<size_t>(workers, 1)) {}

compilation_info test_runner::build(const prepared_program &program) const {
    compilation_info info;

    sandbox::sandbox_options opts;
    opts.work_parent = work_dir;
    opts.limit_address_space = false;

    sandbox::execution_outcome outcome = sandbox::run(*program.build, "", BUILD_TIME_LIMIT, BUILD_MEMORY_LIMIT, opts);
    info.output = outcome.output + outcome.error;
    info.time = outcome.wall_time;
    info.success = outcome.kind == sandbox::outcome_kind::COMPLETED;
    if (!info.success)
        info.error = fmt::format("Compilation failed: {}", outcome.describe());
    return info;
}

test_case_result test_runner::run_one(const prepared_program &program, const test_case &tc, size_t index, double time_limit, int64_t memory_limit) const {
    test_case_result result;
    result.test_case_id = tc.id.empty() ? to_string(index + 1) : tc.id;
    result.hidden = tc.hidden;
    result.points = tc.points;

    fs::path input_path = work_dir / "input" / fmt::format("{}.in", index);
    write_file_content(input_path, tc.input);
    defer {
        error_code ec;
        fs::remove(input_path, ec);
        if (ec) LOG(WARNING) << "Unable to remove input file " << input_path.string() << ": " << ec.message();
    };

    sandbox::sandbox_options opts;
    opts.work_parent = work_dir;
    opts.limit_address_space = program.limit_address_space;

    sandbox::execution_outcome outcome = sandbox::run(program.run, input_path, time_limit, memory_limit, opts);
    result.time = outcome.wall_time;
    result.memory = outcome.memory;
    result.outcome = outcome.kind;

    string actual = normalize_output(outcome.output);
    if (outcome.kind == sandbox::outcome_kind::COMPLETED) {
        result.passed = actual == normalize_output(tc.expected_output);
        if (!tc.hidden) result.error = outcome.error;
    } else {
        result.passed = false;
        result.error = outcome.describe();
        if (!tc.hidden && !outcome.error.empty())
            result.error += "\n" + outcome.error;
    }
    result.score = result.passed ? tc.points : 0;

    if (!tc.hidden) {
        result.input = tc.input;
        result.expected_output = tc.expected_output;
        result.output = actual;
    }
    return result;
}

test_run test_runner::run_all(const prepared_program &program,
                              const optional<compilation_info> &build,
                              const vector<test_case> &test_cases,
                              double time_limit,
                              int64_t memory_limit) const {
    test_run run;
    run.compilation = build;
    if (build && !build->success) {
        run.build_failed = true;
        return run;
    }

    error_code ec;
    fs::create_directories(work_dir / "input", ec);
    if (ec) throw internal_error(fmt::format("Unable to create directory {}: {}", (work_dir / "input").string(), ec.message()));

    run.results.resize(test_cases.size());

    size_t thread_count = min(workers, test_cases.size());
    if (thread_count <= 1) {
        for (size_t i = 0; i < test_cases.size(); ++i)
            run.results[i] = run_one(program, test_cases[i], i, time_limit, memory_limit);
        return run;
    }

    concurrent_queue<size_t> queue;
    for (size_t i = 0; i < test_cases.size(); ++i) queue.push(i);
    queue.close();

    mutex error_mutex;
    exception_ptr first_error;
    atomic<bool> failed{false};

    vector<thread> threads;
    for (size_t t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            size_t i;
            while (!failed && queue.pop(i)) {
                try {
                    // 每个线程只写入自己取到的下标，结果顺序与测试点顺序一致
                    run.results[i] = run_one(program, test_cases[i], i, time_limit, memory_limit);
                } catch (std::exception &e) {
                    LOG(ERROR) << "Test case " << i << " failed to run: " << e.what();
                    lock_guard<mutex> guard(error_mutex);
                    if (!first_error) first_error = current_exception();
                    failed = true;
                }
            }
        });
    }
    for (auto &worker : threads) worker.join();

    if (first_error) rethrow_exception(first_error);
    return run;
}

}  // namespace grader
