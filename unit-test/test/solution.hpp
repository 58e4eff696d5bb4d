#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "common/io_utils.hpp"
#include "judge/solution.hpp"

/**
 * 测试用的提交
 * 用法：
 * 1. test_project project;
 * 2. solution sol = project.add_solution("alice", "int main() { return 0; }");
 * 3. evaluate_solution(sol, your suite)
 */
namespace atst {

struct test_project {
    test_project();

    /**
     * @brief 在项目文件夹中创建一个提交，源文件为 proj.c
     * @param source 源代码，为空时不创建源文件
     */
    solution add_solution(const std::string &name, const std::optional<std::string> &source);

    /**
     * @brief 在项目文件夹中创建一个文件
     */
    std::filesystem::path add_file(const std::string &name, const std::string &content);

    const std::filesystem::path &path() const;

private:
    scoped_temp_directory dir;
};

/**
 * @brief 构造一个只有一个 test_case 的测试
 */
test make_test(const std::string &name, double score, const std::vector<std::string> &args,
               const std::optional<std::string> &input, const std::optional<std::string> &output);

/**
 * @brief 构造一个使用 gcc 编译、时间限制为 2 秒的评测配置
 */
suite make_suite();

}  // namespace atst
