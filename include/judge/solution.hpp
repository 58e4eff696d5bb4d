#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "analysis/analyser.hpp"
#include "judge/compiler.hpp"
#include "judge/script.hpp"
#include "judge/test.hpp"

/**
 * 这个头文件包含一个提交的完整评测
 * 包含：
 * 1. solution 类（表示一个学生的提交）
 * 2. suite 类（表示评测所需的全部配置：编译器、测试、静态检查、脚本）
 * 3. solution_report 类（表示一个提交的评测报告）
 * 4. evaluate_solution 函数（编译、测试、静态检查并计算总分）
 */
namespace atst {

/**
 * @brief 表示一个学生的提交
 * 每个提交是项目文件夹下的一个子文件夹，包含一个源文件
 */
struct solution {
    /**
     * @brief 提交的名字，即子文件夹名
     */
    std::string name;

    /**
     * @brief 提交的文件夹
     */
    std::filesystem::path path;

    /**
     * @brief 源文件路径
     */
    std::filesystem::path source;

    /**
     * @brief 源文件是否存在，不存在时不评测
     */
    bool source_found = false;
};

/**
 * @brief 总分的计算方式
 */
struct scoring_options {
    /**
     * @brief 编译失败时是否仍然扣除静态检查的分数
     */
    bool penalties_on_compile_error = true;

    /**
     * @brief 总分是否至少为 0
     */
    bool clamp_to_zero = false;
};

/**
 * @brief 评测所需的全部配置
 * 所有提交共享同一个 suite，评测过程中不会被修改
 */
struct suite {
    compiler_options compiler;

    std::vector<test> tests;

    std::vector<analyser_uptr> analysers;

    /**
     * @brief 自定义脚本的绝对路径，在每个提交的文件夹中运行
     */
    std::vector<std::filesystem::path> scripts;

    /**
     * @brief 单个 test_case 的默认时间限制
     */
    std::chrono::milliseconds timeout;

    scoring_options scoring;
};

struct solution_report {
    std::string name;

    std::filesystem::path path;

    bool source_found = false;

    bool compiled = false;

    /**
     * @brief 编译器的输出
     */
    std::string compile_log;

    /**
     * @brief 各个测试的结果，编译失败时为空
     */
    std::vector<test_result> tests;

    std::vector<analysis_result> analyses;

    std::vector<script_result> scripts;

    /**
     * @brief 评测这个提交时出现的内部错误，正常评测时为空
     */
    std::string error;

    /**
     * @brief 总分，未截断为非负数之前可以为负
     */
    double score = 0;
};

/**
 * @brief 计算总分
 * 总分 = 编译成功时所有测试的得分 + 所有静态检查的扣分
 * @param report 已经完成测试和静态检查的评测报告
 * @param options 总分的计算方式
 */
double aggregate_score(const solution_report &report, const scoring_options &options);

/**
 * @brief 评测一个提交
 * 静态检查与编译结果无关，编译失败时也会执行。
 * 除了 environment_error 以外的异常都被记录在报告中，不会影响其他提交。
 * @param sol 要评测的提交
 * @param s 评测配置
 * @return 评测报告
 * @throw environment_error 运行环境出错，此时整个评测过程都要终止
 */
solution_report evaluate_solution(const solution &sol, const suite &s);

}  // namespace atst
