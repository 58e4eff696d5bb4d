#pragma once

#include <string>
#include <vector>

namespace atst {

enum class token_kind {
    IDENTIFIER,    // 标识符和关键字
    NUMBER,        // 数字常量
    STRING,        // 字符串常量，包含引号
    CHAR,          // 字符常量，包含引号
    PUNCT,         // 运算符和分隔符
    PREPROCESSOR   // 整行预处理指令，已经去掉注释并合并续行
};

struct token {
    token_kind kind;
    std::string text;
    int line;

    bool is(token_kind k, const std::string &t) const;
    bool is_punct(const std::string &t) const;
};

/**
 * @brief 将 C 源代码切分为记号序列
 * 注释会被丢弃，不会产生记号，因此注释和字符串中的内容不会被当成代码。
 * 这不是完整的 C 词法分析器：未闭合的注释或字符串常量直接结束记号序列，不会报错。
 * @param source 源代码
 * @return 记号序列，每个记号带有所在行号（从 1 开始）
 */
std::vector<token> tokenize(const std::string &source);

/**
 * @brief 判断标识符是否是 C 语言关键字
 */
bool is_keyword(const std::string &identifier);

}  // namespace atst
