#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace atst {

struct atst_exception : std::exception {
    atst_exception();
    explicit atst_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const atst_exception &ex);

    template <typename T>
    atst_exception operator<<(const T &t) const {
        return atst_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是程序自身的逻辑问题，只影响当前提交的评测
 */
struct internal_error : public atst_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示项目配置文件不合法
 * 由配置加载器抛出，此时不会评测任何提交
 */
struct configuration_error : public atst_exception {
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示运行环境出错，属于致命错误
 * 比如无法 fork、无法创建管道、无法写入临时文件夹、无法杀死进程组，
 * 或者启动时就找不到编译器。遇到这种错误时整个评测过程都会终止，
 * 不能被当成单个提交的失败吞掉。
 */
struct environment_error : public atst_exception {
    explicit environment_error(const std::string &message);
};

/**
 * @brief 表示外部程序无法启动（exec 失败）
 * 编译器调用遇到这个错误时会被记录为编译失败，而不是致命错误
 */
struct spawn_error : public atst_exception {
    /**
     * @param command 无法启动的程序
     * @param err exec 返回的 errno
     */
    spawn_error(const std::string &command, int err);

    const std::string command;
    const int error_code;
};

}  // namespace atst
