#include "judge/test.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace atst {
using namespace std;
namespace fs = std::filesystem;

const char *get_display_message(requirement req) {
    switch (req) {
        case requirement::ALL: return "all";
        case requirement::ANY: return "any";
    }
    return "unknown";
}

bool test_case_result::passed() const {
    return stat == status::ACCEPTED;
}

static bool checked_stream_truncated(const optional<expected_output> &expected, bool truncated) {
    return truncated && expected && !expected->wildcard;
}

status judge_execution(const test_case &tc, const execution_result &result) {
    if (result.timed_out())
        return status::TIME_LIMIT_EXCEEDED;

    if (result.signaled()) {
        switch (result.signal) {
            case SIGSEGV:
                return status::SEGMENTATION_FAULT;
            case SIGFPE:
                return status::FLOATING_POINT_ERROR;
            default:
                return status::RUNTIME_ERROR;
        }
    }

    if (checked_stream_truncated(tc.expected_stdout, result.out_truncated) ||
        checked_stream_truncated(tc.expected_stderr, result.err_truncated))
        return status::OUTPUT_LIMIT_EXCEEDED;

    // stdout 和 stderr 都配置了期望输出时，两者都必须匹配
    if (!match_output(tc.expected_stdout, result.out) || !match_output(tc.expected_stderr, result.err))
        return status::WRONG_ANSWER;

    return status::ACCEPTED;
}

test_case_result run_test_case(const fs::path &executable, const test_case &tc, chrono::milliseconds timeout, const fs::path &cwd) {
    run_options opt;
    opt.command = make_command(executable, tc.args);
    opt.stdin_content = tc.stdin_content;
    opt.timeout = timeout;
    opt.working_directory = cwd;
    opt.stream_size = STREAM_SIZE_LIMIT;

    test_case_result result;
    try {
        result.execution = run_process(opt);
    } catch (spawn_error &ex) {
        LOG(ERROR) << "Unable to start " << executable << ": " << ex.what();
        result.stat = status::SYSTEM_ERROR;
        result.error = ex.what();
        return result;
    }
    result.stat = judge_execution(tc, result.execution);
    return result;
}

test_result evaluate_test(const fs::path &executable, const test &t, chrono::milliseconds default_timeout, const fs::path &cwd) {
    test_result result;
    result.name = t.name;
    result.max_score = t.score;

    chrono::milliseconds timeout = t.timeout.value_or(default_timeout);
    for (const test_case &tc : t.cases) {
        result.cases.push_back(run_test_case(executable, tc, timeout, cwd));
        DLOG(INFO) << "Test '" << t.name << "' case " << result.cases.size() << ": " << get_display_message(result.cases.back().stat);
    }

    auto passed = [](const test_case_result &r) { return r.passed(); };
    bool awarded = t.req == requirement::ALL
                       ? all_of(result.cases.begin(), result.cases.end(), passed)
                       : any_of(result.cases.begin(), result.cases.end(), passed);
    if (result.cases.empty()) awarded = false;

    if (awarded) {
        result.score = t.score;
        result.stat = status::ACCEPTED;
    } else {
        result.score = 0;
        auto failed = find_if_not(result.cases.begin(), result.cases.end(), passed);
        result.stat = failed == result.cases.end() ? status::SYSTEM_ERROR : failed->stat;
    }
    return result;
}

}  // namespace atst
