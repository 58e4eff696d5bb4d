#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "process/run.hpp"

namespace atst {

/**
 * @brief 自定义脚本的运行结果
 * 脚本不影响分数，只记录在报告中
 */
struct script_result {
    std::filesystem::path script;

    /**
     * @brief 脚本是否成功启动
     */
    bool started = false;

    execution_result execution;

    /**
     * @brief 脚本无法启动时的错误信息
     */
    std::string error;

    /**
     * @brief 用于报告的状态：exited、signaled、timed out 或者 error
     */
    std::string status() const;
};

/**
 * @brief 在提交的文件夹中运行自定义脚本
 * @param script 脚本的绝对路径
 * @param cwd 提交的文件夹
 * @throw environment_error 运行环境出错时
 */
script_result run_script(const std::filesystem::path &script, const std::filesystem::path &cwd);

}  // namespace atst
