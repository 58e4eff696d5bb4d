#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include "common/concurrent_queue.hpp"
#include "common/exceptions.hpp"

namespace atst {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop(false);

void stop_workers() {
    stop = true;
}

bool workers_stopped() {
    return stop;
}

/**
 * @brief 记录一次 evaluate_solutions 调用中的第一个致命错误
 * 出现致命错误后其他 worker 不再评测新提交，但不影响之后的调用
 */
struct fatal_error_holder {
    void set(exception_ptr ex) {
        scoped_lock guard(mut);
        if (!error) error = ex;
        failed = true;
    }

    bool has_failed() const {
        return failed;
    }

    void rethrow() {
        if (error) rethrow_exception(error);
    }

private:
    mutex mut;
    exception_ptr error;
    atomic<bool> failed{false};
};

static void worker_loop(size_t worker_id, concurrent_queue<size_t> &queue, const vector<solution> &solutions, const suite &s,
                        vector<optional<solution_report>> &reports, fatal_error_holder &fatal) {
    size_t index;
    while (!stop && !fatal.has_failed() && queue.try_pop(index)) {
        const solution &sol = solutions[index];
        DLOG(INFO) << "Worker " << worker_id << " evaluating " << sol.name;
        try {
            reports[index] = evaluate_solution(sol, s);
        } catch (environment_error &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has encountered a fatal error while evaluating " << sol.name << ": " << ex.what();
            fatal.set(current_exception());
        }
    }
}

vector<optional<solution_report>> evaluate_solutions(const vector<solution> &solutions, const suite &s, unsigned jobs) {
    vector<optional<solution_report>> reports(solutions.size());

    concurrent_queue<size_t> queue;
    for (size_t i = 0; i < solutions.size(); ++i)
        queue.push(i);

    fatal_error_holder fatal;
    size_t worker_count = min<size_t>(max(jobs, 1u), max<size_t>(solutions.size(), 1));
    vector<thread> workers;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back(worker_loop, i, ref(queue), cref(solutions), cref(s), ref(reports), ref(fatal));
    for (auto &worker : workers)
        worker.join();

    fatal.rethrow();
    return reports;
}

}  // namespace atst
