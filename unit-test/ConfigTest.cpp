#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "project/config.hpp"
#include "test/solution.hpp"

using namespace std;
using namespace atst;
using namespace nlohmann;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    /**
     * @brief 断言解析失败，并且错误信息包含 message
     */
    static void expect_error(const json &j, const string &message, const fs::path &project = "/nonexistent") {
        try {
            parse_config(j, project);
            ADD_FAILURE() << "Expected configuration_error containing: " << message;
        } catch (configuration_error &e) {
            EXPECT_NE(string(e.what()).find(message), string::npos) << e.what();
        }
    }
};

TEST_F(ConfigTest, MinimalTest) {
    auto config = parse_config(json::parse(R"({"source": "proj.c"})"), "/project");
    EXPECT_EQ(config.source, "proj.c");
    EXPECT_TRUE(config.exclude_dirs.empty());
    EXPECT_EQ(config.evaluation.compiler.cc, "gcc");
    EXPECT_TRUE(config.evaluation.compiler.cflags.empty());
    EXPECT_EQ(config.evaluation.timeout, DEFAULT_TEST_TIMEOUT);
    EXPECT_TRUE(config.evaluation.tests.empty());
    EXPECT_TRUE(config.evaluation.analysers.empty());
    EXPECT_TRUE(config.evaluation.scoring.penalties_on_compile_error);
    EXPECT_FALSE(config.evaluation.scoring.clamp_to_zero);
}

TEST_F(ConfigTest, FullTest) {
    auto config = parse_config(json::parse(R"({
        "source": "main.c",
        "solutions": { "exclude-dirs": ["template", "reference"] },
        "compiler": { "CC": "clang", "CFLAGS": "-std=c11  -Wall -O2", "LDFLAGS": "-lm" },
        "timeout": 1500,
        "scoring": { "penalties-on-compile-error": false, "clamp-to-zero": true },
        "analyses": [
            { "analyser": "no-call", "funs": ["exit", "abort"], "penalty": -0.2 },
            { "analyser": "no-header", "header": "string.h", "penalty": -1 },
            { "analyser": "no-globals", "exceptions": ["word"], "penalty": -0.1 }
        ],
        "tests": [
            { "name": "single", "score": 1.5, "args": "3  4", "stdin": "line\n", "stdout": "lin\n", "timeout": 100 },
            { "name": "list args", "score": 0, "args": ["a b", "c"], "stderr": "*", "requirement": "any" }
        ],
        "scripts": ["check.sh"]
    })"), "/project");

    EXPECT_EQ(config.source, "main.c");
    EXPECT_EQ(config.exclude_dirs, (vector<string>{"template", "reference"}));

    const suite &s = config.evaluation;
    EXPECT_EQ(s.compiler.cc, "clang");
    EXPECT_EQ(s.compiler.cflags, (vector<string>{"-std=c11", "-Wall", "-O2"}));
    EXPECT_EQ(s.compiler.ldflags, (vector<string>{"-lm"}));
    EXPECT_EQ(s.timeout, chrono::milliseconds(1500));
    EXPECT_FALSE(s.scoring.penalties_on_compile_error);
    EXPECT_TRUE(s.scoring.clamp_to_zero);

    ASSERT_EQ(s.analysers.size(), 3u);
    EXPECT_EQ(s.analysers[0]->kind(), "no-call");
    EXPECT_DOUBLE_EQ(s.analysers[0]->penalty(), -0.2);
    EXPECT_EQ(s.analysers[1]->kind(), "no-header");
    EXPECT_EQ(s.analysers[2]->kind(), "no-globals");
    EXPECT_DOUBLE_EQ(s.analysers[2]->penalty(), -0.1);

    ASSERT_EQ(s.tests.size(), 2u);
    const test &single = s.tests[0];
    EXPECT_EQ(single.name, "single");
    EXPECT_DOUBLE_EQ(single.score, 1.5);
    EXPECT_EQ(single.req, requirement::ALL);
    EXPECT_EQ(single.timeout, chrono::milliseconds(100));
    ASSERT_EQ(single.cases.size(), 1u);
    EXPECT_EQ(single.cases[0].args, (vector<string>{"3", "4"}));
    EXPECT_EQ(single.cases[0].stdin_content, "line\n");
    ASSERT_TRUE(single.cases[0].expected_stdout.has_value());
    EXPECT_FALSE(single.cases[0].expected_stdout->wildcard);
    EXPECT_EQ(single.cases[0].expected_stdout->text, "lin\n");
    EXPECT_FALSE(single.cases[0].expected_stderr.has_value());

    const test &list = s.tests[1];
    EXPECT_EQ(list.req, requirement::ANY);
    EXPECT_FALSE(list.timeout.has_value());
    EXPECT_EQ(list.cases[0].args, (vector<string>{"a b", "c"}));
    EXPECT_FALSE(list.cases[0].stdin_content.has_value());
    EXPECT_FALSE(list.cases[0].expected_stdout.has_value());
    ASSERT_TRUE(list.cases[0].expected_stderr.has_value());
    EXPECT_TRUE(list.cases[0].expected_stderr->wildcard);

    ASSERT_EQ(s.scripts.size(), 1u);
    EXPECT_EQ(s.scripts[0], fs::path("/project/check.sh"));
}

TEST_F(ConfigTest, TestCasesTest) {
    auto config = parse_config(json::parse(R"({
        "source": "proj.c",
        "tests": [{
            "name": "multiple test cases",
            "score": 1.0,
            "args": "ignored",
            "test-cases": [
                { "args": "1", "stdin": "single line\n", "stdout": "s\n" },
                { "args": "2", "stdin": "first\nsecond\n", "stdout": "fi\nse\n" }
            ]
        }]
    })"), "/project");

    ASSERT_EQ(config.evaluation.tests.size(), 1u);
    const test &t = config.evaluation.tests[0];
    ASSERT_EQ(t.cases.size(), 2u);
    EXPECT_EQ(t.cases[0].args, (vector<string>{"1"}));
    EXPECT_EQ(t.cases[1].args, (vector<string>{"2"}));
    EXPECT_EQ(t.cases[1].expected_stdout->text, "fi\nse\n");
}

TEST_F(ConfigTest, FileContentTest) {
    test_project project;
    project.add_file("input", "alpha\nbeta\n");
    project.add_file("data/output", "a\nb\n");

    auto config = parse_config(json::parse(R"({
        "source": "proj.c",
        "tests": [{ "name": "file input", "score": 1, "args": "1", "stdin": "<input", "stdout": "< data/output" }]
    })"), project.path());

    const test_case &tc = config.evaluation.tests[0].cases[0];
    EXPECT_EQ(tc.stdin_content, "alpha\nbeta\n");
    EXPECT_EQ(tc.expected_stdout->text, "a\nb\n");

    expect_error(json::parse(R"({
        "source": "proj.c",
        "tests": [{ "name": "missing", "score": 1, "stdin": "<nonexistent" }]
    })"), "'missing' refers to file 'nonexistent' in field 'stdin'", project.path());

    expect_error(json::parse(R"({
        "source": "proj.c",
        "tests": [{ "name": "escape", "score": 1, "stdin": "<../secret" }]
    })"), "Invalid configuration", project.path());
}

TEST_F(ConfigTest, InvalidConfigTest) {
    expect_error(json::parse("[]"), "top level entry is not a JSON object");
    expect_error(json::parse("{}"), "'config' is missing a mandatory field 'source'");
    expect_error(json::parse(R"({"source": 1})"), "'config' has invalid value of field 'source' (string expected)");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t"}]})"), "'t' is missing a mandatory field 'score'");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t", "score": "1"}]})"), "'t' has invalid value of field 'score' (float number expected)");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t", "score": 1, "args": 3}]})"), "'t' has invalid value of field 'args'");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t", "score": 1, "requirement": "most"}]})"), "'t' has invalid value of field 'requirement'");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t", "score": 1, "test-cases": []}]})"), "'t' has invalid value of field 'test-cases'");
    expect_error(json::parse(R"({"source": "proj.c", "tests": [{"name": "t", "score": 1, "test-cases": [{"stdin": 1}]}]})"), "'t case 1' has invalid value of field 'stdin'");
    expect_error(json::parse(R"({"source": "proj.c", "timeout": -5})"), "'config' has invalid value of field 'timeout'");
    expect_error(json::parse(R"({"source": "proj.c", "analyses": [{"analyser": "no-call", "penalty": -1}]})"), "'no-call analyser' is missing a mandatory field 'funs'");
    expect_error(json::parse(R"({"source": "proj.c", "analyses": [{"analyser": "no-header", "header": "a.h"}]})"), "'no-header analyser' is missing a mandatory field 'penalty'");
    expect_error(json::parse(R"({"source": "proj.c", "analyses": [{"analyser": "no-globals", "exceptions": ["("], "penalty": -1}]})"), "invalid exception pattern");
    expect_error(json::parse(R"({"source": "proj.c", "compiler": "gcc"})"), "'compiler' has incorrect format");
}

TEST_F(ConfigTest, UnsupportedOptionsTest) {
    // 不支持的配置项只产生警告
    auto config = parse_config(json::parse(R"({
        "source": "proj.c",
        "unknown": true,
        "compiler": { "CC": "gcc", "CXX": "g++" },
        "analyses": [{ "analyser": "no-goto", "penalty": -1 }],
        "tests": [{ "name": "t", "score": 1, "memory": 64 }]
    })"), "/project");
    EXPECT_TRUE(config.evaluation.analysers.empty());
    EXPECT_EQ(config.evaluation.tests.size(), 1u);
}

TEST_F(ConfigTest, LoadConfigTest) {
    test_project project;
    project.add_file("config.json", R"({"source": "proj.c", "timeout": 250})");
    project.add_file("broken.json", R"({"source": )");

    auto config = load_config(project.path(), "config.json");
    EXPECT_EQ(config.source, "proj.c");
    EXPECT_EQ(config.evaluation.timeout, chrono::milliseconds(250));

    EXPECT_THROW(load_config(project.path(), "broken.json"), configuration_error);
    EXPECT_THROW(load_config(project.path(), "missing.json"), configuration_error);
}
