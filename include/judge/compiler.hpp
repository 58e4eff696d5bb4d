#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace atst {

/**
 * @brief 表示提交的程序编译错误
 * 编译器返回非零值、超时或者无法启动时抛出，
 * 由 compile_solution 转换为失败的 compile_result，不会传播到调用者
 */
struct compilation_error : public atst_exception {
    const std::string error_log;

    compilation_error(const std::string &what, const std::string &error_log);
};

/**
 * @brief 编译器配置，对应配置文件中的 compiler 部分
 */
struct compiler_options {
    /**
     * @brief 编译器程序名，在 PATH 中查找
     */
    std::string cc = "gcc";

    /**
     * @brief 编译选项，用于 cc -c 这一步
     */
    std::vector<std::string> cflags;

    /**
     * @brief 链接选项，放在目标文件之后，比如 -lm
     */
    std::vector<std::string> ldflags;
};

struct compile_result {
    bool success = false;

    /**
     * @brief 编译出的可执行文件，仅在 success 时有效
     */
    std::filesystem::path executable;

    /**
     * @brief 编译器的输出，编译失败时包含错误原因
     */
    std::string log;

    /**
     * @brief 存放编译产物的临时文件夹，compile_result 销毁时删除
     * 测试也以这个文件夹作为工作目录运行
     */
    scoped_temp_directory build_dir;
};

/**
 * @brief 检查编译器是否存在
 * 在评测开始前调用，编译器不存在属于致命错误，此时不评测任何提交
 * @throw environment_error 找不到编译器时
 */
void check_compiler(const compiler_options &options);

/**
 * @brief 编译一个提交的源代码
 * 先执行 CC CFLAGS -c source -o <tmp>/<stem>.o，再执行 CC <tmp>/<stem>.o LDFLAGS -o <tmp>/<stem>。
 * 源代码原地读取，不会被复制或修改。
 * @param name 提交的名字，用于命名临时文件夹
 * @param source 源代码路径
 * @param options 编译器配置
 * @return 编译结果，编译失败时 success 为假，log 中保存编译器输出
 * @throw environment_error 无法创建临时文件夹或者无法创建子进程
 */
compile_result compile_solution(const std::string &name, const std::filesystem::path &source, const compiler_options &options);

}  // namespace atst
