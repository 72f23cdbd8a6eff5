#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "judge/test_runner.hpp"
#include "judge/verdict.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

bool acceptance_registry::record(const string &user_id, const string &prob_id) {
    scoped_lock guard(mut);
    return accepted.insert({user_id, prob_id}).second;
}

bool acceptance_registry::contains(const string &user_id, const string &prob_id) const {
    scoped_lock guard(mut);
    return accepted.count({user_id, prob_id});
}

judging_orchestrator::judging_orchestrator(server::submission_store &store, const language_registry &languages)
    : store(store), languages(languages) {}

void judging_orchestrator::admit(const submission &submit) const {
    try {
        assert_safe_path(submit.sub_id);
    } catch (runtime_error &) {
        throw configuration_error(fmt::format("Invalid submission id '{}'", submit.sub_id));
    }

    languages.resolve(submit.language);

    if (!submit.allowed_languages.empty() &&
        find(submit.allowed_languages.begin(), submit.allowed_languages.end(), submit.language) == submit.allowed_languages.end())
        throw configuration_error(fmt::format("Language {} is not allowed for problem {}", submit.language, submit.prob_id));

    if (!(submit.time_limit > 0))
        throw configuration_error(fmt::format("Invalid time limit {} of {}", submit.time_limit, submit.sub_id));
    if (submit.memory_limit <= 0)
        throw configuration_error(fmt::format("Invalid memory limit {} of {}", submit.memory_limit, submit.sub_id));
}

void judging_orchestrator::claim(const string &sub_id) {
    scoped_lock guard(mut);
    if (!running.insert(sub_id).second)
        throw already_in_progress(sub_id);
}

void judging_orchestrator::release(const string &sub_id) {
    scoped_lock guard(mut);
    running.erase(sub_id);
}

bool judging_orchestrator::in_flight(const string &sub_id) const {
    scoped_lock guard(mut);
    return running.count(sub_id);
}

acceptance_registry &judging_orchestrator::acceptances() {
    return accepted;
}

judge_result judging_orchestrator::submit(const submission &submit) {
    admit(submit);
    claim(submit.sub_id);
    defer { release(submit.sub_id); };
    return judge(submit);
}

future<judge_result> judging_orchestrator::submit_async(const submission &submit) {
    admit(submit);
    claim(submit.sub_id);
    scoped_guard guard([&] { release(submit.sub_id); });
    auto result = async(launch::async, [this, submit] {
        defer { release(submit.sub_id); };
        return judge(submit);
    });
    guard.dismiss();
    return result;
}

static double total_points(const vector<test_case> &test_cases) {
    double sum = 0;
    for (auto &tc : test_cases) sum += tc.points;
    return sum;
}

judge_result judging_orchestrator::judge(const submission &submit) {
    judge_result result;
    result.sub_id = submit.sub_id;
    result.user_id = submit.user_id;
    result.prob_id = submit.prob_id;
    result.start_time = chrono::system_clock::now();

    LOG(INFO) << "Judging " << submit;

    bool faulted = false;
    string fault;
    optional<compilation_info> build;
    try {
        const language &lang = languages.resolve(submit.language);

        scoped_directory work_dir(RUN_DIR, submit.sub_id, DEBUG);
        fs::path source_dir = work_dir.path() / "compile";
        error_code ec;
        fs::create_directories(source_dir, ec);
        if (ec) throw internal_error(fmt::format("Unable to create directory {}: {}", source_dir.string(), ec.message()));

        prepared_program program = lang.prepare(source_dir, submit.code);
        test_runner runner(work_dir.path());

        store.update_status(submit.sub_id, status::COMPILING);
        if (program.build) {
            build = runner.build(program);
            if (!build->success)
                LOG(INFO) << submit << " failed to compile: " << build->error;
        }

        if (!build || build->success)
            store.update_status(submit.sub_id, status::RUNNING);

        test_run run = runner.run_all(program, build, submit.test_cases, submit.time_limit, submit.memory_limit);
        result.verdict = resolve_verdict(run.results, run.build_failed);
        if (run.build_failed) {
            result.verdict.total = submit.test_cases.size();
            result.verdict.max_score = total_points(submit.test_cases);
        }
        result.compilation = move(run.compilation);
        result.results = move(run.results);
        for (auto &tc : result.results) {
            result.time = max(result.time, tc.time);
            result.memory = max(result.memory, tc.memory);
        }
    } catch (grader_exception &ex) {
        LOG(ERROR) << submit << " crashed: " << ex;
        faulted = true;
        fault = ex.what();
    } catch (std::exception &ex) {
        LOG(ERROR) << submit << " crashed: " << ex.what() << endl
                   << boost::diagnostic_information(ex);
        faulted = true;
        fault = ex.what();
    }

    if (faulted) {
        result.verdict = grader::verdict();
        result.verdict.status = status::RUNTIME_ERROR;
        result.verdict.total = submit.test_cases.size();
        result.verdict.max_score = total_points(submit.test_cases);
        result.results.clear();
        result.time = 0;
        result.memory = 0;

        compilation_info info = build.value_or(compilation_info());
        info.error = fault;
        result.compilation = info;
    }

    result.end_time = chrono::system_clock::now();
    if (result.verdict.status == status::ACCEPTED)
        result.first_acceptance = accepted.record(submit.user_id, submit.prob_id);

    store.report_result(result);
    return result;
}

}  // namespace grader
