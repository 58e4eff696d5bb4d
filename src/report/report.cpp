#include "report/report.hpp"
#include <fmt/format.h>
#include <cmath>

namespace atst {
using namespace std;
using json = nlohmann::json;

string format_score(double score) {
    double rounded = round(score * 100.0) / 100.0;
    if (rounded == 0) rounded = 0;  // 避免输出 -0
    return fmt::format("{}", rounded);
}

json to_json(const test_result &result) {
    json cases = json::array();
    for (const auto &c : result.cases) {
        json item = {
            {"status", get_display_message(c.stat)},
            {"exitcode", c.execution.exited() ? json(c.execution.exitcode) : json()},
            {"signal", c.execution.signaled() ? json(c.execution.signal) : json()},
            {"timed_out", c.execution.timed_out()},
            {"wall_time", c.execution.wall_time}};
        if (!c.error.empty()) item["error"] = c.error;
        cases.push_back(item);
    }
    return {
        {"name", result.name},
        {"score", result.score},
        {"max_score", result.max_score},
        {"status", get_display_message(result.stat)},
        {"cases", cases}};
}

json to_json(const analysis_result &result) {
    return {
        {"analyser", result.kind},
        {"violated", result.violated},
        {"penalty", result.penalty},
        {"detail", result.detail}};
}

json to_json(const script_result &result) {
    return {
        {"script", result.script.filename().string()},
        {"status", result.status()},
        {"exitcode", result.started && result.execution.exited() ? json(result.execution.exitcode) : json()}};
}

json to_json(const solution_report &report) {
    json tests = json::array(), analyses = json::array(), scripts = json::array();
    for (const auto &t : report.tests) tests.push_back(to_json(t));
    for (const auto &a : report.analyses) analyses.push_back(to_json(a));
    for (const auto &s : report.scripts) scripts.push_back(to_json(s));
    return {
        {"name", report.name},
        {"path", report.path.string()},
        {"source_found", report.source_found},
        {"compiled", report.compiled},
        {"compile_log", report.compile_log},
        {"tests", tests},
        {"analyses", analyses},
        {"scripts", scripts},
        {"error", report.error.empty() ? json() : json(report.error)},
        {"score", report.source_found ? json(report.score) : json()}};
}

json to_json(const vector<solution_report> &reports) {
    json solutions = json::array();
    for (const auto &report : reports)
        solutions.push_back(to_json(report));
    return {{"solutions", solutions}};
}

static string first_line(const string &str) {
    return str.substr(0, str.find('\n'));
}

void write_text_report(ostream &os, const vector<solution_report> &reports, bool verbose) {
    for (const auto &report : reports) {
        if (!report.source_found) {
            os << report.name << ": no source found" << endl;
            continue;
        }
        os << report.name << ": " << format_score(report.score) << endl;
        if (!verbose) continue;

        if (!report.error.empty())
            os << "  error: " << report.error << endl;
        if (!report.compiled && report.error.empty())
            os << "  compilation failed: " << first_line(report.compile_log) << endl;
        for (const auto &t : report.tests)
            os << fmt::format("  test '{}': {}/{} ({})", t.name, format_score(t.score), format_score(t.max_score), get_display_message(t.stat)) << endl;
        for (const auto &a : report.analyses)
            if (a.violated)
                os << fmt::format("  {}: {} ({})", a.kind, format_score(a.penalty), a.detail) << endl;
        for (const auto &s : report.scripts)
            os << fmt::format("  script {}: {}", s.script.filename().string(), s.status())
               << (s.started && s.execution.exited() ? fmt::format(" with code {}", s.execution.exitcode) : "") << endl;
    }
}

void write_report(ostream &os, const vector<solution_report> &reports, report_format format, bool verbose) {
    if (format == report_format::JSON)
        os << to_json(reports).dump(2) << endl;
    else
        write_text_report(os, reports, verbose);
}

}  // namespace atst
