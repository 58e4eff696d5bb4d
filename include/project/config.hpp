#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/solution.hpp"

namespace atst {

/**
 * @brief 项目配置文件
 * 配置文件是一个 JSON 对象，例如：
 * @code{.json}
 * {
 *     "source": "proj.c",
 *     "solutions": { "exclude-dirs": ["template"] },
 *     "compiler": { "CC": "gcc", "CFLAGS": "-std=c99 -Wall", "LDFLAGS": "-lm" },
 *     "timeout": 5000,
 *     "scoring": { "penalties-on-compile-error": true, "clamp-to-zero": false },
 *     "analyses": [
 *         { "analyser": "no-call", "funs": ["exit"], "penalty": -0.2 }
 *     ],
 *     "tests": [
 *         { "name": "single line", "score": 1.0, "args": "3", "stdin": "line\n", "stdout": "lin\n" },
 *         { "name": "file", "score": 1.0, "args": ["1"], "stdin": "<input", "stdout": "<output" }
 *     ],
 *     "scripts": ["check.sh"]
 * }
 * @endcode
 * "<name" 表示读取项目文件夹下的文件 name 的内容，stdout 和 stderr 的值为 "*" 时匹配任何输出。
 */
struct project_config {
    /**
     * @brief 每个提交文件夹中的源文件名
     */
    std::string source;

    /**
     * @brief 不是提交的子文件夹，比如模板
     */
    std::vector<std::string> exclude_dirs;

    /**
     * @brief 评测配置
     */
    suite evaluation;
};

/**
 * @brief 解析项目配置
 * 不支持的配置项只会产生警告
 * @param j 配置文件的内容
 * @param project 项目文件夹，"<name" 形式的输入输出和脚本都相对于这个文件夹
 * @throw configuration_error 配置不合法时
 */
project_config parse_config(const nlohmann::json &j, const std::filesystem::path &project);

/**
 * @brief 读取并解析项目配置文件
 * @param project 项目文件夹
 * @param config 配置文件路径，相对于项目文件夹（绝对路径则直接使用）
 * @throw configuration_error 配置文件无法读取或者不合法时
 */
project_config load_config(const std::filesystem::path &project, const std::filesystem::path &config);

}  // namespace atst
