#include "server/local_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader::server {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static json read_json(const fs::path &path) {
    try {
        return json::parse(read_file_content(path));
    } catch (internal_error &e) {
        throw configuration_error(e.what());
    } catch (json::parse_error &e) {
        throw configuration_error(fmt::format("Unable to parse {}: {}", path, e.what()));
    }
}

static string id_to_string(const json &id) {
    return id.is_string() ? id.get<string>() : id.dump();
}

problem parse_problem(const string &prob_id, const json &j) {
    problem prob;
    prob.prob_id = prob_id;
    try {
        // 缺少限制的题目不予评测，不使用默认值
        prob.time_limit = get_value<double>(j, "timeLimit");
        double memory_mb = get_value<double>(j, "memoryLimit");
        prob.memory_limit = (int64_t)(memory_mb * 1024 * 1024);
        prob.allowed_languages = get_value_def<vector<string>>(j, {}, "allowedLanguages");

        if (exists(j, "testCases")) {
            const json &cases = access(j, "testCases");
            if (!cases.is_array()) throw build_invalid_argument(j, "testCases");
            for (size_t i = 0; i < cases.size(); ++i) {
                const json &entry = cases[i];
                test_case tc;
                tc.id = exists(entry, "id") ? id_to_string(entry["id"]) : to_string(i + 1);
                tc.input = get_value_def<string>(entry, "", "input");
                if (exists(entry, "output"))
                    tc.expected_output = get_value<string>(entry, "output");
                else
                    tc.expected_output = get_value_def<string>(entry, "", "expectedOutput");
                tc.points = get_value_def<double>(entry, 10, "points");
                tc.hidden = get_value_def<bool>(entry, false, "isHidden");
                prob.test_cases.push_back(move(tc));
            }
        }
    } catch (invalid_argument &e) {
        throw configuration_error(fmt::format("Invalid problem {}: {}", prob_id, e.what()));
    }
    return prob;
}

local_problem_store::local_problem_store(const fs::path &dir) : dir(dir) {}

problem local_problem_store::get_problem(const string &prob_id) {
    fs::path path;
    try {
        path = dir / (assert_safe_path(prob_id) + ".json");
    } catch (runtime_error &e) {
        throw configuration_error(e.what());
    }
    if (!fs::exists(path))
        throw configuration_error(fmt::format("Problem {} does not exist in {}", prob_id, dir));
    return parse_problem(prob_id, read_json(path));
}

local_submission_store::local_submission_store(const fs::path &dir) : dir(dir) {
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw internal_error(fmt::format("Unable to create directory {}: {}", dir, ec.message()));
}

void local_submission_store::update_status(const string &sub_id, status st) {
    scoped_lock guard(mut);
    json &record = history[sub_id];
    record.push_back({{"status", get_wire_name(st)},
                      {"time", format_time(chrono::system_clock::now())}});

    json j = {{"submissionId", sub_id},
              {"status", get_wire_name(st)},
              {"history", record}};
    write_file_content(dir / (assert_safe_path(sub_id) + ".json"), j.dump(4));
    LOG(INFO) << "Submission " << sub_id << " is " << get_display_message(st);
}

void local_submission_store::report_result(const judge_result &result) {
    scoped_lock guard(mut);
    json j = result;
    json &record = history[result.sub_id];
    record.push_back({{"status", get_wire_name(result.verdict.status)},
                      {"time", format_time(result.end_time)}});
    j["history"] = record;
    write_file_content(dir / (assert_safe_path(result.sub_id) + ".json"), j.dump(4));
    history.erase(result.sub_id);

    LOG(INFO) << fmt::format("Submission {} finished: {}, score {}/{}",
                             result.sub_id, get_display_message(result.verdict.status),
                             result.verdict.score, result.verdict.max_score);
}

submission load_submission(const fs::path &path, problem_store &problems) {
    json j = read_json(path);

    submission submit;
    string prob_id;
    try {
        submit.sub_id = id_to_string(access(j, "id"));
        submit.user_id = exists(j, "userId") ? id_to_string(j["userId"]) : "";
        prob_id = id_to_string(access(j, "problemId"));
        submit.language = get_value<string>(j, "language");
        submit.code = get_value<string>(j, "code");
    } catch (invalid_argument &e) {
        throw configuration_error(fmt::format("Invalid submission {}: {}", path, e.what()));
    }

    problem prob = problems.get_problem(prob_id);
    submit.prob_id = prob.prob_id;
    submit.time_limit = prob.time_limit;
    submit.memory_limit = prob.memory_limit;
    submit.test_cases = move(prob.test_cases);
    submit.allowed_languages = move(prob.allowed_languages);
    return submit;
}

}  // namespace grader::server
