#pragma once

#include <optional>
#include <string>

namespace atst {

/**
 * @brief 期望输出
 * 可以是一段文本，也可以是通配符（匹配任何输出，包括空输出）
 */
struct expected_output {
    bool wildcard = false;

    std::string text;

    static expected_output any();
    static expected_output literal(const std::string &text);
};

/**
 * @brief 将换行符统一为 \n，\r\n 和单独的 \r 都视为换行
 */
std::string normalize_line_endings(const std::string &str);

/**
 * @brief 比较一个输出流和期望输出
 * @param expected 期望输出，为空表示这个流不需要检查，总是匹配
 * @param actual 程序实际输出
 * @return 是否匹配
 */
bool match_output(const std::optional<expected_output> &expected, const std::string &actual);

}  // namespace atst
