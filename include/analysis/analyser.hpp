#pragma once

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "analysis/lexer.hpp"

/**
 * 这个头文件包含静态检查
 * 静态检查只做词法层面的匹配，不会完整解析 C 语言。
 * 无法确定的情况一律视为没有违规，宁可漏报也不能误判。
 */
namespace atst {

struct analysis_result {
    /**
     * @brief 检查类型，比如 no-call
     */
    std::string kind;

    bool violated = false;

    /**
     * @brief 实际扣除的分数，未违规时为 0
     */
    double penalty = 0;

    /**
     * @brief 违规的具体位置，比如 call of 'exit' on line 9
     */
    std::string detail;
};

/**
 * @brief 静态检查器
 * 检查器在多个评测线程间共享，因此 find_violation 不能修改检查器的状态
 */
struct analyser {
    /**
     * @param penalty 违规时的扣分，一般为负数
     */
    explicit analyser(double penalty);
    virtual ~analyser() = default;

    /**
     * @brief 检查器类型，与配置文件中的 analyser 字段一致
     */
    virtual std::string kind() const = 0;

    /**
     * @brief 在记号序列中查找第一处违规
     * @param tokens 源代码的记号序列
     * @return 违规的描述，没有违规时为空
     */
    virtual std::optional<std::string> find_violation(const std::vector<token> &tokens) const = 0;

    double penalty() const;

    analysis_result analyse(const std::vector<token> &tokens) const;

private:
    double penalty_value;
};

typedef std::unique_ptr<analyser> analyser_uptr;

/**
 * @brief 禁止调用某些函数
 * 只有标识符后紧跟左括号才算调用，exitCode 不会被当成 exit
 */
struct no_call_analyser : public analyser {
    no_call_analyser(const std::vector<std::string> &funs, double penalty);

    std::string kind() const override;
    std::optional<std::string> find_violation(const std::vector<token> &tokens) const override;

    const std::vector<std::string> funs;
};

/**
 * @brief 禁止包含某个头文件
 * 不区分 <header> 和 "header" 两种写法
 */
struct no_header_analyser : public analyser {
    no_header_analyser(const std::string &header, double penalty);

    std::string kind() const override;
    std::optional<std::string> find_violation(const std::vector<token> &tokens) const override;

    const std::string header;
};

/**
 * @brief 禁止定义全局变量
 * 函数定义、函数声明、typedef、结构体声明和函数内的局部变量都不算全局变量，
 * extern 声明算作全局变量。名字完整匹配某个例外正则表达式的变量不算违规。
 */
struct no_globals_analyser : public analyser {
    /**
     * @throw configuration_error 例外正则表达式不合法时
     */
    no_globals_analyser(const std::vector<std::string> &exceptions, double penalty);

    std::string kind() const override;
    std::optional<std::string> find_violation(const std::vector<token> &tokens) const override;

    /**
     * @brief 判断变量名是否完整匹配某个例外
     */
    bool is_exception(const std::string &name) const;

private:
    std::vector<std::regex> exceptions;
};

/**
 * @brief 对源代码运行全部静态检查
 * 源代码只切分一次记号，每个检查器产生一个结果，顺序与 analysers 一致
 */
std::vector<analysis_result> run_analysers(const std::string &source, const std::vector<analyser_uptr> &analysers);

}  // namespace atst
