#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "judge/solution.hpp"

namespace atst {

enum class report_format {
    TEXT,
    JSON
};

/**
 * @brief 将分数四舍五入到两位小数并格式化，比如 5.8、3.14
 */
std::string format_score(double score);

nlohmann::json to_json(const test_result &result);

nlohmann::json to_json(const analysis_result &result);

nlohmann::json to_json(const script_result &result);

nlohmann::json to_json(const solution_report &report);

/**
 * @brief 整个评测的 JSON 报告
 * 格式为 {"solutions": [...]}，分数不做舍入
 */
nlohmann::json to_json(const std::vector<solution_report> &reports);

/**
 * @brief 输出文本报告
 * 每个提交一行 "name: score"，verbose 时额外输出每个测试、违规的静态检查和编译错误
 */
void write_text_report(std::ostream &os, const std::vector<solution_report> &reports, bool verbose);

void write_report(std::ostream &os, const std::vector<solution_report> &reports, report_format format, bool verbose);

}  // namespace atst
