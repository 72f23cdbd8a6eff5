#include "judge/language.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static vector<string> format_args(const vector<string> &templ, const fs::path &dir, const fs::path &source) {
    vector<string> args;
    for (auto &arg : templ)
        args.push_back(fmt::format(fmt::runtime(arg),
                                   fmt::arg("dir", dir.string()),
                                   fmt::arg("source", source.string())));
    return args;
}

prepared_program language::prepare(const fs::path &dir, const string &code) const {
    prepared_program program;
    program.source_path = dir / source_name;
    write_file_content(program.source_path, code);

    if (!build_template.empty())
        program.build = sandbox::command{format_args(build_template, dir, program.source_path), env};
    program.run = sandbox::command{format_args(run_template, dir, program.source_path), env};
    program.limit_address_space = limit_address_space;
    return program;
}

void language_registry::register_language(const language &lang) {
    if (lang.tag.empty())
        throw configuration_error("Language tag must not be empty");
    if (lang.run_template.empty())
        throw configuration_error(fmt::format("Language {} has no run command", lang.tag));
    try {
        assert_safe_path(lang.source_name);
    } catch (runtime_error &) {
        throw configuration_error(fmt::format("Language {} has invalid source file name '{}'", lang.tag, lang.source_name));
    }
    try {
        format_args(lang.build_template, "/dir", "/dir/source");
        format_args(lang.run_template, "/dir", "/dir/source");
    } catch (fmt::format_error &e) {
        throw configuration_error(fmt::format("Language {} has invalid command template: {}", lang.tag, e.what()));
    }
    languages[lang.tag] = lang;
}

const language &language_registry::resolve(const string &tag) const {
    auto it = languages.find(tag);
    if (it == languages.end()) throw unsupported_language(tag);
    return it->second;
}

bool language_registry::contains(const string &tag) const {
    return languages.count(tag);
}

vector<string> language_registry::tags() const {
    vector<string> result;
    for (auto &[tag, lang] : languages) result.push_back(tag);
    return result;
}

void language_registry::load(const fs::path &path) {
    json config;
    try {
        config = json::parse(read_file_content(path));
    } catch (internal_error &e) {
        throw configuration_error(e.what());
    } catch (json::parse_error &e) {
        throw configuration_error(fmt::format("Unable to parse language file {}: {}", path, e.what()));
    }
    if (!config.is_array())
        throw configuration_error(fmt::format("Language file {} must contain an array", path));

    for (auto &entry : config) {
        language lang;
        try {
            lang.tag = get_value<string>(entry, "tag");
            lang.source_name = get_value<string>(entry, "source");
            lang.build_template = get_value_def<vector<string>>(entry, {}, "build");
            lang.run_template = get_value<vector<string>>(entry, "run");
            lang.limit_address_space = get_value_def<bool>(entry, true, "limitAddressSpace");
            lang.env = get_value_def<map<string, string>>(entry, {}, "env");
        } catch (invalid_argument &e) {
            throw configuration_error(fmt::format("Invalid language in {}: {}", path, e.what()));
        }
        LOG(INFO) << "Registering language " << lang.tag << " from " << path;
        register_language(lang);
    }
}

language_registry language_registry::defaults() {
    language_registry registry;

    registry.register_language({"cpp", "solution.cpp",
                                {"g++", "-std=c++17", "-O2", "-Wall", "-o", "{dir}/solution", "{source}"},
                                {"{dir}/solution"},
                                true,
                                {}});
    registry.register_language({"c", "solution.c",
                                {"gcc", "-std=c11", "-O2", "-Wall", "-o", "{dir}/solution", "{source}", "-lm"},
                                {"{dir}/solution"},
                                true,
                                {}});
    registry.register_language({"python", "solution.py",
                                {},
                                {"python3", "{source}"},
                                true,
                                {}});
    registry.register_language({"java", "Solution.java",
                                {"javac", "-encoding", "UTF-8", "-d", "{dir}", "{source}"},
                                {"java", "-cp", "{dir}", "Solution"},
                                false,
                                {}});
    registry.register_language({"javascript", "solution.js",
                                {},
                                {"node", "{source}"},
                                false,
                                {}});
    return registry;
}

}  // namespace grader
