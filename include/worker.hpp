#pragma once

#include <optional>
#include <thread>
#include <vector>
#include "judge/solution.hpp"

/**
 * 并行评测相关函数
 * 所有提交的下标被放入一个并发队列，每个 worker 线程不断从队列中取出下标并评测对应的提交，
 * 评测报告写入预先分配好的对应位置，因此报告的顺序与提交的顺序一致，写入报告也不需要加锁。
 * 提交之间没有共享的可变状态：每个提交有自己的临时文件夹和子进程。
 */
namespace atst {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 评测完当前提交后检查标记，
 * 如果停止，则不再评测新提交。这个函数会在 SIGINT 的信号处理函数中调用。
 */
void stop_workers();

/**
 * @brief 是否调用过 stop_workers
 */
bool workers_stopped();

/**
 * @brief 使用 jobs 个线程并行评测所有提交
 * @param solutions 要评测的提交
 * @param s 评测配置
 * @param jobs 线程数，至少为 1
 * @return 评测报告，顺序与 solutions 一致；worker 被停止时，未评测的提交对应的位置为空
 * @throw environment_error 任意一个提交遇到运行环境错误时，等待其他 worker 结束后重新抛出
 */
std::vector<std::optional<solution_report>> evaluate_solutions(const std::vector<solution> &solutions, const suite &s, unsigned jobs);

}  // namespace atst
