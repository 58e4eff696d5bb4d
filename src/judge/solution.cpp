#include "judge/solution.hpp"
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace atst {
using namespace std;

double aggregate_score(const solution_report &report, const scoring_options &options) {
    double score = 0;
    if (report.compiled)
        for (const auto &t : report.tests)
            score += t.score;

    if (report.compiled || options.penalties_on_compile_error)
        for (const auto &a : report.analyses)
            score += a.penalty;

    if (options.clamp_to_zero)
        score = max(0.0, score);
    return score;
}

static void evaluate(const solution &sol, const suite &s, solution_report &report) {
    string source = read_file_content(sol.source);
    report.analyses = run_analysers(source, s.analysers);

    compile_result compiled = compile_solution(sol.name, sol.source, s.compiler);
    report.compiled = compiled.success;
    report.compile_log = compiled.log;

    if (compiled.success) {
        for (const test &t : s.tests)
            report.tests.push_back(evaluate_test(compiled.executable, t, s.timeout, compiled.build_dir.path()));
    }

    for (const auto &script : s.scripts)
        report.scripts.push_back(run_script(script, sol.path));

    report.score = aggregate_score(report, s.scoring);
}

solution_report evaluate_solution(const solution &sol, const suite &s) {
    solution_report report;
    report.name = sol.name;
    report.path = sol.path;
    report.source_found = sol.source_found;

    if (!sol.source_found) {
        report.error = "no source found";
        LOG(WARNING) << "Solution " << sol.name << ": no source found";
        return report;
    }

    try {
        evaluate(sol, s, report);
    } catch (environment_error &) {
        throw;
    } catch (atst_exception &ex) {
        LOG(ERROR) << "Error while evaluating solution " << sol.name << endl << ex;
        report.error = ex.what();
        report.score = 0;
    } catch (exception &ex) {
        LOG(ERROR) << "Error while evaluating solution " << sol.name << ": " << ex.what();
        report.error = ex.what();
        report.score = 0;
    }
    return report;
}

}  // namespace atst
