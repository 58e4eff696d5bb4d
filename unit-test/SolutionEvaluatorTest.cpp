#include <fstream>
#include <map>
#include <boost/algorithm/string.hpp>
#include "gtest/gtest.h"
#include "judge/solution.hpp"
#include "project/config.hpp"
#include "project/discovery.hpp"
#include "test/solution.hpp"
#include "worker.hpp"

using namespace std;
using namespace atst;
namespace fs = std::filesystem;

static const char *PREFIX_PROGRAM = R"(
#include <stdio.h>
#include <stdlib.h>

int main(int argc, char *argv[]) {
    int n = argc > 1 ? atoi(argv[1]) : 0;
    int len = 0, c;
    while ((c = getchar()) != EOF) {
        if (c == '\n') {
            putchar('\n');
            len = 0;
        } else if (len++ < n) {
            putchar(c);
        }
    }
    return 0;
}
)";

class SolutionEvaluatorTest : public ::testing::Test {
protected:
    static suite prefix_suite() {
        suite s = make_suite();
        s.tests.push_back(make_test("single line", 1.0, {"3"}, "line\n", "lin\n"));
        s.tests.push_back(make_test("multiple lines", 1.0, {"3"}, "file\nwith\nlines\n", "fil\nwit\nlin\n"));
        s.tests.push_back(make_test("lines with spaces", 1.0, {"7"}, "first line\nsecond line\n", "first l\nsecond \n"));
        s.tests.push_back(make_test("empty input", 1.0, {"1"}, nullopt, ""));
        return s;
    }
};

TEST_F(SolutionEvaluatorTest, FullScoreTest) {
    test_project project;
    solution sol = project.add_solution("alice", string(PREFIX_PROGRAM));
    suite s = prefix_suite();

    auto report = evaluate_solution(sol, s);
    EXPECT_EQ(report.name, "alice");
    EXPECT_TRUE(report.compiled) << report.compile_log;
    EXPECT_EQ(report.error, "");
    ASSERT_EQ(report.tests.size(), 4u);
    for (auto &t : report.tests)
        EXPECT_EQ(t.stat, status::ACCEPTED) << t.name;
    EXPECT_DOUBLE_EQ(report.score, 4.0);
}

TEST_F(SolutionEvaluatorTest, PenaltyTest) {
    test_project project;
    string source = PREFIX_PROGRAM;
    boost::algorithm::replace_first(source, "return 0;", "exit(0);");
    solution sol = project.add_solution("bob", source);

    suite s = prefix_suite();
    s.analysers.push_back(make_unique<no_call_analyser>(vector<string>{"exit"}, -0.2));
    s.analysers.push_back(make_unique<no_globals_analyser>(vector<string>{}, -0.1));

    auto report = evaluate_solution(sol, s);
    EXPECT_TRUE(report.compiled) << report.compile_log;
    ASSERT_EQ(report.analyses.size(), 2u);
    EXPECT_TRUE(report.analyses[0].violated);
    EXPECT_FALSE(report.analyses[1].violated);
    EXPECT_NEAR(report.score, 3.8, 1e-9);
}

TEST_F(SolutionEvaluatorTest, CompileErrorTest) {
    test_project project;
    solution sol = project.add_solution("carol", R"(
#include <stdlib.h>
int counter;
int main(void) {
    exit(counter)
}
)");

    suite s = prefix_suite();
    s.analysers.push_back(make_unique<no_call_analyser>(vector<string>{"exit"}, -0.2));
    s.analysers.push_back(make_unique<no_globals_analyser>(vector<string>{}, -0.1));

    auto report = evaluate_solution(sol, s);
    EXPECT_FALSE(report.compiled);
    EXPECT_FALSE(report.compile_log.empty());
    EXPECT_TRUE(report.tests.empty());
    // 静态检查不依赖编译结果
    ASSERT_EQ(report.analyses.size(), 2u);
    EXPECT_TRUE(report.analyses[0].violated);
    EXPECT_TRUE(report.analyses[1].violated);
    EXPECT_NEAR(report.score, -0.3, 1e-9);

    s.scoring.penalties_on_compile_error = false;
    report = evaluate_solution(sol, s);
    EXPECT_DOUBLE_EQ(report.score, 0);
}

TEST_F(SolutionEvaluatorTest, TimeoutTest) {
    test_project project;
    solution sol = project.add_solution("dave", R"(
#include <stdio.h>
#include <stdlib.h>

int main(int argc, char *argv[]) {
    if (argc > 1 && atoi(argv[1]) == 0)
        for (;;) {}
    printf("ok\n");
    return 0;
}
)");

    suite s = make_suite();
    s.timeout = chrono::milliseconds(500);
    s.tests.push_back(make_test("before", 1.0, {"1"}, nullopt, "ok\n"));
    s.tests.push_back(make_test("hang", 1.0, {"0"}, nullopt, "ok\n"));
    s.tests.push_back(make_test("after", 1.0, {"2"}, nullopt, "ok\n"));

    auto report = evaluate_solution(sol, s);
    ASSERT_EQ(report.tests.size(), 3u);
    EXPECT_EQ(report.tests[0].stat, status::ACCEPTED);
    EXPECT_EQ(report.tests[1].stat, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(report.tests[2].stat, status::ACCEPTED);
    EXPECT_DOUBLE_EQ(report.score, 2.0);
}

TEST_F(SolutionEvaluatorTest, NoSourceTest) {
    test_project project;
    solution sol = project.add_solution("erin", nullopt);

    auto report = evaluate_solution(sol, prefix_suite());
    EXPECT_FALSE(report.source_found);
    EXPECT_FALSE(report.compiled);
    EXPECT_EQ(report.error, "no source found");
    EXPECT_DOUBLE_EQ(report.score, 0);
}

TEST_F(SolutionEvaluatorTest, ScriptTest) {
    test_project project;
    solution sol = project.add_solution("frank", string(PREFIX_PROGRAM));
    fs::path script = project.add_file("check.sh", "#!/bin/sh\ntest -f proj.c\n");
    fs::permissions(script, fs::perms::owner_all);

    suite s = prefix_suite();
    s.scripts.push_back(script);
    s.scripts.push_back(project.path() / "missing.sh");

    auto report = evaluate_solution(sol, s);
    ASSERT_EQ(report.scripts.size(), 2u);
    EXPECT_TRUE(report.scripts[0].started);
    EXPECT_EQ(report.scripts[0].status(), "exited");
    EXPECT_EQ(report.scripts[0].execution.exitcode, 0);
    EXPECT_FALSE(report.scripts[1].started);
    EXPECT_EQ(report.scripts[1].status(), "error");
    // 脚本不影响分数
    EXPECT_DOUBLE_EQ(report.score, 4.0);
}

/**
 * @brief 读取 expected-scores 文件，每行形如 "name: score"
 */
static map<string, double> read_expected_scores(const fs::path &file) {
    map<string, double> result;
    ifstream fin(file);
    string line;
    while (getline(fin, line)) {
        auto colon = line.find(':');
        if (colon == string::npos) continue;
        result[boost::algorithm::trim_copy(line.substr(0, colon))] = stod(line.substr(colon + 1));
    }
    return result;
}

TEST_F(SolutionEvaluatorTest, ProjectTest) {
    fs::path project = fs::path(ATST_TEST_DATA_DIR) / "projects" / "arg_stdin_stdout";
    auto expected = read_expected_scores(project / "expected-scores");
    ASSERT_FALSE(expected.empty());

    project_config config = load_config(project, "config.json");
    auto solutions = discover_solutions(project, config.source, config.exclude_dirs);
    ASSERT_EQ(solutions.size(), expected.size());

    auto reports = evaluate_solutions(solutions, config.evaluation, 4);
    ASSERT_EQ(reports.size(), solutions.size());
    for (size_t i = 0; i < reports.size(); ++i) {
        ASSERT_TRUE(reports[i].has_value());
        const solution_report &report = *reports[i];
        EXPECT_EQ(report.name, solutions[i].name);
        ASSERT_EQ(expected.count(report.name), 1u) << report.name;
        EXPECT_NEAR(report.score, expected[report.name], 1e-9) << report.name;
    }
}

TEST_F(SolutionEvaluatorTest, SingleSolutionTest) {
    fs::path project = fs::path(ATST_TEST_DATA_DIR) / "projects" / "arg_stdin_stdout";
    project_config config = load_config(project, "config.json");

    auto solutions = discover_solution(project, config.source, "xideal");
    ASSERT_EQ(solutions.size(), 1u);
    auto report = evaluate_solution(solutions[0], config.evaluation);
    EXPECT_NEAR(report.score, 5.8, 1e-9);
    ASSERT_EQ(report.analyses.size(), 3u);
    EXPECT_EQ(report.analyses[0].detail, "call of 'exit' on line 9");
}
