#pragma once

namespace atst {

/**
 * @brief 表示测试点或整个测试的评测结果
 */
enum class status {
    /**
     * @brief 测试点通过
     * 程序在时间限制内结束、没有因为信号崩溃，且所有配置了期望输出的流都匹配
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 至少有一个配置了期望输出的流（stdout 或 stderr）与期望内容不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * 程序及其整个进程组在超时后被强制杀死，捕获到的部分输出不参与比较
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序出现运行时错误
     * 因为 SIGSEGV、SIGFPE 以外的信号而崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 应用程序出现段错误，一般是访问了非法内存地址导致的。
     * 捕捉到 SIGSEGV 信号时返回该评测结果。
     */
    SEGMENTATION_FAULT = 4,

    /**
     * @brief 浮点运算错误，一般是除零错误。
     * 捕捉到 SIGFPE 信号时返回该评测结果。
     */
    FLOATING_POINT_ERROR = 5,

    /**
     * @brief 用户程序输出内容过多
     * 需要比较的流超出了 STREAM_SIZE_LIMIT 被截断，因此无法比较
     */
    OUTPUT_LIMIT_EXCEEDED = 6,

    /**
     * @brief 内部错误，评测系统出错
     * 比如编译出的可执行文件无法启动
     */
    SYSTEM_ERROR = 7
};

const char *get_display_message(status);

}  // namespace atst
