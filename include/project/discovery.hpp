#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "judge/solution.hpp"

namespace atst {

/**
 * @brief 查找项目文件夹中的所有提交
 * 项目文件夹的每个直接子文件夹都是一个提交，按名字排序，跳过 exclude_dirs 中的文件夹和隐藏文件夹。
 * 源文件不存在的提交也会被返回，此时 source_found 为假。
 * @param project 项目文件夹
 * @param source 每个提交中的源文件名
 * @param exclude_dirs 不是提交的子文件夹
 * @throw environment_error 项目文件夹无法读取时
 */
std::vector<solution> discover_solutions(const std::filesystem::path &project, const std::string &source, const std::vector<std::string> &exclude_dirs);

/**
 * @brief 只查找一个提交
 * @return 提交，子文件夹不存在时为空
 */
std::vector<solution> discover_solution(const std::filesystem::path &project, const std::string &source, const std::string &name);

}  // namespace atst
