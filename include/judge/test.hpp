#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/output_matcher.hpp"
#include "process/run.hpp"

/**
 * 这个头文件包含测试的定义和评测
 * 1. test_case 类（表示一次程序运行：参数、标准输入、期望输出）
 * 2. test 类（表示一个有分数的测试，包含一个或多个 test_case）
 * 3. evaluate_test 函数（运行一个测试的全部 test_case 并计算得分）
 */
namespace atst {

/**
 * @brief 测试得分的条件
 */
enum class requirement {
    ALL,  // 所有 test_case 都通过才得分
    ANY   // 至少一个 test_case 通过就得分
};

const char *get_display_message(requirement);

/**
 * @brief 表示一次程序运行
 * 从配置文件加载后不再修改
 */
struct test_case {
    /**
     * @brief 传递给程序的命令行参数，不包含 argv[0]
     */
    std::vector<std::string> args;

    /**
     * @brief 写入标准输入的内容，为空时程序直接读到 EOF
     */
    std::optional<std::string> stdin_content;

    /**
     * @brief 期望的标准输出，为空时不检查标准输出
     */
    std::optional<expected_output> expected_stdout;

    /**
     * @brief 期望的标准错误流，为空时不检查标准错误流
     */
    std::optional<expected_output> expected_stderr;
};

/**
 * @brief 表示一个有分数的测试
 * 分数要么全部获得，要么为 0，同一个测试的 test_case 之间没有部分分
 */
struct test {
    std::string name;

    /**
     * @brief 测试的分数，非负
     */
    double score = 0;

    requirement req = requirement::ALL;

    /**
     * @brief 测试包含的 test_case，至少有一个
     */
    std::vector<test_case> cases;

    /**
     * @brief 单个 test_case 的时间限制，为空时使用项目的时间限制
     */
    std::optional<std::chrono::milliseconds> timeout;
};

struct test_case_result {
    status stat = status::SYSTEM_ERROR;

    execution_result execution;

    /**
     * @brief 无法启动程序时的错误信息
     */
    std::string error;

    bool passed() const;
};

struct test_result {
    std::string name;

    /**
     * @brief 获得的分数，只能是 0 或者 max_score
     */
    double score = 0;

    double max_score = 0;

    /**
     * @brief 得分时为 ACCEPTED，否则是第一个没有通过的 test_case 的结果
     */
    status stat = status::ACCEPTED;

    /**
     * @brief 各个 test_case 的结果，顺序与配置文件一致
     */
    std::vector<test_case_result> cases;
};

/**
 * @brief 根据运行结果判断一个 test_case 是否通过
 * 超时或者因信号崩溃时不比较输出；需要比较的流被截断时返回 OUTPUT_LIMIT_EXCEEDED
 */
status judge_execution(const test_case &tc, const execution_result &result);

/**
 * @brief 运行一个 test_case
 * @param executable 编译出的可执行文件
 * @param tc 要运行的 test_case
 * @param timeout 时间限制
 * @param cwd 程序的工作目录
 * @throw environment_error 运行环境出错时
 */
test_case_result run_test_case(const std::filesystem::path &executable, const test_case &tc, std::chrono::milliseconds timeout, const std::filesystem::path &cwd);

/**
 * @brief 评测一个测试
 * 按配置的顺序运行全部 test_case，再根据 requirement 决定是否给分
 * @param executable 编译出的可执行文件
 * @param t 要评测的测试
 * @param default_timeout 测试没有单独设置时间限制时使用的时间限制
 * @param cwd 程序的工作目录
 * @throw environment_error 运行环境出错时
 */
test_result evaluate_test(const std::filesystem::path &executable, const test &t, std::chrono::milliseconds default_timeout, const std::filesystem::path &cwd);

}  // namespace atst
