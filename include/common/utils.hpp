#pragma once

#include <fmt/format.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return fmt::formatter<std::string>::format(p.string(), ctx);
    }
};

namespace atst {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, const Head &head, const Args &... args) {
    // 字符串常量 Head 为 char[N]，加上 const 之后退化为 const char *
    to_string_cont<std::decay_t<const Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表
 * @note 与 system(cmd) 的区别是，参数不经过 shell，避免了转义导致的安全问题
 * @code{.cpp}
 *     std::vector<std::string> cflags = {"-std=c99", "-Wall"};
 *     // {"gcc", "-std=c99", "-Wall", "-c", "proj.c"}
 *     auto command = make_command("gcc", cflags, "-c", std::filesystem::path("proj.c"));
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_command(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 将命令行参数列表拼接成便于阅读的字符串，用于日志
 */
std::string join_command(const std::vector<std::string> &command);

/**
 * @brief 按空白字符切分字符串，忽略连续的空白
 * 用于解析 "-std=c99 -Wall" 这样的编译选项和测试参数
 */
std::vector<std::string> split_whitespace(const std::string &str);

/**
 * @brief 在 PATH 中查找可执行文件，相当于 which
 * 若 name 中包含 '/'，则直接检查该路径
 * @param name 可执行文件名
 * @return 可执行文件的路径，找不到时返回空
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace atst
