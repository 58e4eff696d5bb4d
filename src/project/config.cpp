#include "project/config.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace atst {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static configuration_error invalid_field(const string &component, const string &field, const string &expected_type) {
    return configuration_error(fmt::format("'{}' has invalid value of field '{}' ({} expected)", component, field, expected_type));
}

static configuration_error missing_field(const string &component, const string &field) {
    return configuration_error(fmt::format("'{}' is missing a mandatory field '{}'", component, field));
}

/**
 * @brief 检查 j 是一个对象，且只包含 fields 中的键，否则产生警告
 */
static void check_fields(const json &j, const string &component, const vector<string> &fields) {
    if (!j.is_object())
        throw configuration_error(fmt::format("'{}' has incorrect format", component));
    for (const auto &item : j.items()) {
        if (find(fields.begin(), fields.end(), item.key()) == fields.end())
            LOG(WARNING) << "Configuration of '" << component << "' has unsupported option '" << item.key() << "'";
    }
}

static const json *optional_field(const json &j, const string &field) {
    return exists(j, field) ? find_path(j, field) : nullptr;
}

static optional<string> optional_string(const json &j, const string &component, const string &field) {
    const json *value = optional_field(j, field);
    if (!value) return nullopt;
    if (!value->is_string()) throw invalid_field(component, field, "string");
    return value->get<string>();
}

static string mandatory_string(const json &j, const string &component, const string &field) {
    if (auto value = optional_string(j, component, field)) return *value;
    throw missing_field(component, field);
}

static optional<double> optional_number(const json &j, const string &component, const string &field) {
    const json *value = optional_field(j, field);
    if (!value) return nullopt;
    if (!value->is_number()) throw invalid_field(component, field, "float number");
    return value->get<double>();
}

static double mandatory_number(const json &j, const string &component, const string &field) {
    if (auto value = optional_number(j, component, field)) return *value;
    throw missing_field(component, field);
}

static optional<bool> optional_bool(const json &j, const string &component, const string &field) {
    const json *value = optional_field(j, field);
    if (!value) return nullopt;
    if (!value->is_boolean()) throw invalid_field(component, field, "boolean");
    return value->get<bool>();
}

static optional<vector<string>> optional_string_list(const json &j, const string &component, const string &field) {
    const json *value = optional_field(j, field);
    if (!value) return nullopt;
    if (!value->is_array()) throw invalid_field(component, field, "list of strings");
    vector<string> result;
    for (auto &item : *value) {
        if (!item.is_string()) throw invalid_field(component, field, "list of strings");
        result.push_back(item.get<string>());
    }
    return result;
}

static vector<string> mandatory_string_list(const json &j, const string &component, const string &field) {
    if (auto value = optional_string_list(j, component, field)) return *value;
    throw missing_field(component, field);
}

static optional<chrono::milliseconds> optional_timeout(const json &j, const string &component) {
    const json *value = optional_field(j, "timeout");
    if (!value) return nullopt;
    if (!value->is_number_integer() || value->get<long long>() <= 0)
        throw invalid_field(component, "timeout", "positive integer of milliseconds");
    return chrono::milliseconds(value->get<long long>());
}

/**
 * @brief 读取 stdin、stdout 或 stderr 的值，"<name" 替换为文件 name 的内容
 */
static optional<string> read_content(const json &j, const string &component, const string &field, const fs::path &project) {
    auto value = optional_string(j, component, field);
    if (!value || value->empty() || value->front() != '<') return value;

    string name = boost::algorithm::trim_copy(value->substr(1));
    fs::path file = project / assert_safe_path(name);
    try {
        return read_file_content(file);
    } catch (system_error &e) {
        throw configuration_error(fmt::format("'{}' refers to file '{}' in field '{}' which cannot be read", component, name, field));
    }
}

static optional<expected_output> read_expected(const json &j, const string &component, const string &field, const fs::path &project) {
    const json *value = optional_field(j, field);
    if (value && value->is_string() && value->get<string>() == "*")
        return expected_output::any();
    if (auto content = read_content(j, component, field, project))
        return expected_output::literal(*content);
    return nullopt;
}

static vector<string> read_args(const json &j, const string &component) {
    const json *value = optional_field(j, "args");
    if (!value) return {};
    if (value->is_string()) return split_whitespace(value->get<string>());
    if (value->is_array()) return *optional_string_list(j, component, "args");
    throw invalid_field(component, "args", "string or list of strings");
}

static test_case parse_test_case(const json &j, const string &component, const fs::path &project) {
    test_case tc;
    tc.args = read_args(j, component);
    tc.stdin_content = read_content(j, component, "stdin", project);
    tc.expected_stdout = read_expected(j, component, "stdout", project);
    tc.expected_stderr = read_expected(j, component, "stderr", project);
    return tc;
}

static test parse_test(const json &j, const fs::path &project) {
    test t;
    if (!j.is_object())
        throw configuration_error("'test' has incorrect format");
    t.name = optional_string(j, "test", "name").value_or("");
    string component = t.name.empty() ? "test" : t.name;
    check_fields(j, component, {"name", "score", "args", "stdin", "stdout", "stderr", "requirement", "test-cases", "timeout"});

    t.score = mandatory_number(j, component, "score");
    if (t.score < 0)
        throw invalid_field(component, "score", "non-negative number");

    string req = optional_string(j, component, "requirement").value_or("all");
    if (req == "all")
        t.req = requirement::ALL;
    else if (req == "any")
        t.req = requirement::ANY;
    else
        throw invalid_field(component, "requirement", "'all' or 'any'");

    t.timeout = optional_timeout(j, component);

    if (const json *cases = optional_field(j, "test-cases")) {
        if (!cases->is_array() || cases->empty())
            throw invalid_field(component, "test-cases", "non-empty list");
        for (const string &field : {"args", "stdin", "stdout", "stderr"})
            if (exists(j, field))
                LOG(WARNING) << "Field '" << field << "' of '" << component << "' is ignored because 'test-cases' is given";
        for (size_t i = 0; i < cases->size(); ++i) {
            string case_component = fmt::format("{} case {}", component, i + 1);
            check_fields(cases->at(i), case_component, {"args", "stdin", "stdout", "stderr"});
            t.cases.push_back(parse_test_case(cases->at(i), case_component, project));
        }
    } else {
        t.cases.push_back(parse_test_case(j, component, project));
    }
    return t;
}

static double analyser_penalty(const json &j, const string &component) {
    double penalty = mandatory_number(j, component, "penalty");
    if (penalty > 0)
        LOG(WARNING) << "Penalty of '" << component << "' is positive, it will increase the score";
    return penalty;
}

static vector<analyser_uptr> parse_analysers(const json &j) {
    vector<analyser_uptr> result;
    if (!j.is_array())
        throw invalid_field("config", "analyses", "list of analyses");
    for (const json &analysis : j) {
        if (!analysis.is_object())
            throw configuration_error("'analysis' has incorrect format");
        string kind = mandatory_string(analysis, "analysis", "analyser");
        string component = kind + " analyser";
        if (kind == "no-call") {
            check_fields(analysis, component, {"analyser", "funs", "penalty"});
            result.push_back(make_unique<no_call_analyser>(
                mandatory_string_list(analysis, component, "funs"),
                analyser_penalty(analysis, component)));
        } else if (kind == "no-header") {
            check_fields(analysis, component, {"analyser", "header", "penalty"});
            result.push_back(make_unique<no_header_analyser>(
                mandatory_string(analysis, component, "header"),
                analyser_penalty(analysis, component)));
        } else if (kind == "no-globals") {
            check_fields(analysis, component, {"analyser", "exceptions", "penalty"});
            result.push_back(make_unique<no_globals_analyser>(
                optional_string_list(analysis, component, "exceptions").value_or(vector<string>()),
                analyser_penalty(analysis, component)));
        } else {
            LOG(WARNING) << "Configuration contains an unsupported analysis '" << kind << "'";
        }
    }
    return result;
}

project_config parse_config(const json &j, const fs::path &project) {
    if (!j.is_object())
        throw configuration_error("top level entry is not a JSON object");

    project_config result;
    result.source = mandatory_string(j, "config", "source");
    result.evaluation.timeout = DEFAULT_TEST_TIMEOUT;

    for (const auto &item : j.items()) {
        const string &key = item.key();
        const json &value = item.value();
        if (key == "source") {
            // 已经读取
        } else if (key == "solutions") {
            check_fields(value, "solutions", {"exclude-dirs"});
            result.exclude_dirs = optional_string_list(value, "solutions", "exclude-dirs").value_or(vector<string>());
        } else if (key == "compiler") {
            check_fields(value, "compiler", {"CC", "CFLAGS", "LDFLAGS"});
            compiler_options &compiler = result.evaluation.compiler;
            compiler.cc = optional_string(value, "compiler", "CC").value_or("gcc");
            compiler.cflags = split_whitespace(optional_string(value, "compiler", "CFLAGS").value_or(""));
            compiler.ldflags = split_whitespace(optional_string(value, "compiler", "LDFLAGS").value_or(""));
        } else if (key == "timeout") {
            if (auto timeout = optional_timeout(j, "config"))
                result.evaluation.timeout = *timeout;
        } else if (key == "scoring") {
            check_fields(value, "scoring", {"penalties-on-compile-error", "clamp-to-zero"});
            scoring_options &scoring = result.evaluation.scoring;
            scoring.penalties_on_compile_error = optional_bool(value, "scoring", "penalties-on-compile-error").value_or(true);
            scoring.clamp_to_zero = optional_bool(value, "scoring", "clamp-to-zero").value_or(false);
        } else if (key == "analyses") {
            result.evaluation.analysers = parse_analysers(value);
        } else if (key == "tests") {
            if (!value.is_array())
                throw invalid_field("config", "tests", "list of tests");
            for (const json &t : value)
                result.evaluation.tests.push_back(parse_test(t, project));
        } else if (key == "scripts") {
            for (auto &script : optional_string_list(j, "config", "scripts").value_or(vector<string>()))
                result.evaluation.scripts.push_back(project / assert_safe_path(script));
        } else {
            LOG(WARNING) << "Unsupported config option: " << key;
        }
    }
    return result;
}

project_config load_config(const fs::path &project, const fs::path &config) {
    fs::path file = project / config;
    string content;
    try {
        content = read_file_content(file);
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to read configuration file {}", file));
    }

    json j;
    try {
        j = json::parse(content);
    } catch (json::parse_error &e) {
        throw configuration_error(fmt::format("{} is not valid JSON: {}", file, e.what()));
    }
    LOG(INFO) << "Loaded configuration " << file;
    return parse_config(j, project);
}

}  // namespace atst
