#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace atst {

/**
 * @brief 子进程的结束方式
 */
enum class termination {
    /**
     * @brief 子进程自己正常退出，此时 exitcode 有效
     */
    EXITED,

    /**
     * @brief 子进程因为信号崩溃（比如 SIGSEGV），此时 signal 有效
     */
    SIGNALED,

    /**
     * @brief 子进程在超时后被强制杀死
     */
    TIMED_OUT
};

const char *get_display_message(termination);

struct execution_result {
    termination how = termination::EXITED;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief 捕获的标准输出，超时或崩溃时也会保留已经捕获的部分
     */
    std::string out;

    /**
     * @brief 捕获的标准错误流
     */
    std::string err;

    /**
     * @brief 标准输出是否因为超过 stream_size 被截断
     */
    bool out_truncated = false;

    bool err_truncated = false;

    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = 0;

    bool exited() const;
    bool signaled() const;
    bool timed_out() const;
};

struct run_options {
    /**
     * @brief 外部命令，command[0] 是程序名，会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 写入子进程标准输入的内容，为空时子进程直接读到 EOF
     */
    std::optional<std::string> stdin_content;

    /**
     * @brief 子进程的运行时间上限，超时后整个进程组会被杀死
     */
    std::chrono::milliseconds timeout;

    /**
     * @brief 子进程的工作目录，为空时继承父进程的工作目录
     */
    std::filesystem::path working_directory;

    /**
     * @brief 额外的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 每个输出流最多捕获的字节数，超出部分被丢弃
     */
    long long stream_size;
};

/**
 * @brief 运行外部程序直到它结束或超时
 * 子进程在自己的进程组中运行，返回前整个进程组一定已经被杀死，
 * 因此用户程序 fork 出的子孙进程也不会在超时后继续运行。
 * 子进程崩溃或者超时都是正常的返回值，不会抛出异常。
 * @param opt 运行参数
 * @return 运行结果
 * @throw spawn_error 程序不存在或者无法执行
 * @throw environment_error 无法创建管道、无法 fork 或者无法杀死进程组
 */
execution_result run_process(const run_options &opt);

}  // namespace atst
