#include "analysis/analyser.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace atst {
using namespace std;

analyser::analyser(double penalty) : penalty_value(penalty) {}

double analyser::penalty() const {
    return penalty_value;
}

analysis_result analyser::analyse(const vector<token> &tokens) const {
    analysis_result result;
    result.kind = kind();
    if (auto violation = find_violation(tokens)) {
        result.violated = true;
        result.penalty = penalty();
        result.detail = *violation;
    }
    return result;
}

no_call_analyser::no_call_analyser(const vector<string> &funs, double penalty)
    : analyser(penalty), funs(funs) {}

string no_call_analyser::kind() const {
    return "no-call";
}

static bool is_define(const token &t) {
    static const regex define_regex(R"(^#\s*define\b)");
    return t.kind == token_kind::PREPROCESSOR && regex_search(t.text, define_regex);
}

optional<string> no_call_analyser::find_violation(const vector<token> &tokens) const {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const token &t = tokens[i];
        if (is_define(t)) {
            // 宏定义整行是一个记号，去掉 # 后重新切分，检查宏展开的内容
            vector<token> body = tokenize(t.text.substr(1));
            for (token &b : body) b.line += t.line - 1;
            if (auto violation = find_violation(body)) return violation;
            continue;
        }
        if (t.kind != token_kind::IDENTIFIER || i + 1 >= tokens.size() || !tokens[i + 1].is_punct("(")) continue;
        if (find(funs.begin(), funs.end(), t.text) != funs.end())
            return fmt::format("call of '{}' on line {}", t.text, t.line);
    }
    return nullopt;
}

no_header_analyser::no_header_analyser(const string &header, double penalty)
    : analyser(penalty), header(header) {}

string no_header_analyser::kind() const {
    return "no-header";
}

optional<string> no_header_analyser::find_violation(const vector<token> &tokens) const {
    static const regex include_regex(R"(^#\s*include\s*[<"]\s*([^>"]+?)\s*[>"])");
    for (const token &t : tokens) {
        if (t.kind != token_kind::PREPROCESSOR) continue;
        smatch match;
        if (regex_search(t.text, match, include_regex) && match[1] == header)
            return fmt::format("include of '{}' on line {}", header, t.line);
    }
    return nullopt;
}

no_globals_analyser::no_globals_analyser(const vector<string> &patterns, double penalty)
    : analyser(penalty) {
    for (auto &pattern : patterns) {
        try {
            exceptions.emplace_back(pattern);
        } catch (regex_error &e) {
            throw configuration_error(fmt::format("'no-globals' has invalid exception pattern '{}': {}", pattern, e.what()));
        }
    }
}

string no_globals_analyser::kind() const {
    return "no-globals";
}

bool no_globals_analyser::is_exception(const string &name) const {
    return any_of(exceptions.begin(), exceptions.end(), [&](const regex &r) {
        return regex_match(name, r);
    });
}

/**
 * @brief 跳过从 i 开始的括号组
 * @return 配对的右括号之后的位置；tokens[i] 不是 open 时返回 i；括号不配对时返回 npos
 */
static size_t skip_group(const vector<token> &tokens, size_t i, const char *open, const char *close) {
    if (i >= tokens.size() || !tokens[i].is_punct(open)) return i;
    int depth = 0;
    for (; i < tokens.size(); ++i) {
        if (tokens[i].is_punct(open))
            ++depth;
        else if (tokens[i].is_punct(close) && --depth == 0)
            return i + 1;
    }
    return string::npos;
}

static bool is_attribute(const string &identifier) {
    return identifier == "__attribute__" || identifier == "__declspec" ||
           identifier == "__asm__" || identifier == "asm" || identifier == "_Alignas";
}

static bool is_tag_keyword(const string &identifier) {
    return identifier == "struct" || identifier == "union" || identifier == "enum";
}

/**
 * @brief 声明中有顶层的参数列表而且没有初始化，则后面的大括号是函数体
 */
static bool is_function_definition(const vector<token> &decl) {
    int parens = 0;
    bool has_params = false;
    for (const token &t : decl) {
        if (t.is_punct("(")) {
            if (parens == 0) has_params = true;
            ++parens;
        } else if (t.is_punct(")")) {
            --parens;
        } else if (parens == 0 && t.is_punct("=")) {
            return false;
        }
    }
    return has_params;
}

/**
 * @brief 提取文件作用域中以分号结尾的声明
 * 函数体被整体跳过，结构体定义和大括号初始化被替换为一个 "{}" 记号，
 * 最后一个没有分号的声明被忽略
 */
static vector<vector<token>> top_level_declarations(const vector<token> &tokens) {
    vector<vector<token>> result;
    vector<token> decl;
    size_t i = 0;
    while (i < tokens.size()) {
        const token &t = tokens[i];
        if (t.kind == token_kind::PREPROCESSOR) {
            ++i;
        } else if (t.is_punct("{")) {
            size_t end = skip_group(tokens, i, "{", "}");
            if (end == string::npos) break;  // 大括号不配对，放弃剩余部分
            if (is_function_definition(decl))
                decl.clear();
            else
                decl.push_back({token_kind::PUNCT, "{}", t.line});
            i = end;
        } else if (t.is_punct("}")) {
            decl.clear();
            ++i;
        } else if (t.is_punct(";")) {
            result.push_back(move(decl));
            decl.clear();
            ++i;
        } else {
            decl.push_back(t);
            ++i;
        }
    }
    return result;
}

/**
 * @brief 在顶层逗号处将声明切分为多个声明符
 * 第一个声明符包含类型说明
 */
static vector<vector<token>> split_declarators(const vector<token> &decl) {
    vector<vector<token>> result(1);
    int depth = 0;
    for (const token &t : decl) {
        if (t.is_punct("(") || t.is_punct("["))
            ++depth;
        else if (t.is_punct(")") || t.is_punct("]"))
            --depth;
        else if (depth == 0 && t.is_punct(",")) {
            result.emplace_back();
            continue;
        }
        result.back().push_back(t);
    }
    return result;
}

struct declarator_name {
    const token *name = nullptr;

    /**
     * @brief 名字后紧跟参数列表，即函数声明
     */
    bool function = false;
};

/**
 * @brief 找出声明符声明的名字
 * 名字是 (、[、=、: 或结尾之前最后一个不是关键字的标识符，
 * struct/union/enum 后面的标签名不算，(*name) 形式的函数指针算作变量
 */
static declarator_name find_declarator_name(const vector<token> &tokens) {
    declarator_name result;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const token &t = tokens[i];
        if (t.kind == token_kind::IDENTIFIER) {
            if (is_attribute(t.text)) {
                size_t next = skip_group(tokens, i + 1, "(", ")");
                if (next == string::npos) return {};
                i = next - 1;
            } else if (is_keyword(t.text)) {
                if (is_tag_keyword(t.text) && i + 1 < tokens.size() && tokens[i + 1].kind == token_kind::IDENTIFIER)
                    ++i;
            } else {
                result.name = &t;
            }
        } else if (t.is_punct("(")) {
            // 名字之后的括号是参数列表，参数里的 char *s 不是声明的名字
            if (result.name) {
                result.function = true;
                return result;
            }
            size_t j = i + 1;
            bool pointer = false;
            while (j < tokens.size() && (tokens[j].is_punct("*") || (tokens[j].kind == token_kind::IDENTIFIER && is_keyword(tokens[j].text)))) {
                if (tokens[j].is_punct("*")) pointer = true;
                ++j;
            }
            if (pointer && j < tokens.size() && tokens[j].kind == token_kind::IDENTIFIER) {
                result.name = &tokens[j];
                // void (*signal(int, void (*)(int)))(int) 声明的是函数
                result.function = j + 1 < tokens.size() && tokens[j + 1].is_punct("(");
                return result;
            }
            return result;
        } else if (t.is_punct("[") || t.is_punct("=") || t.is_punct(":")) {
            return result;
        }
    }
    return result;
}

optional<string> no_globals_analyser::find_violation(const vector<token> &tokens) const {
    for (const auto &decl : top_level_declarations(tokens)) {
        if (decl.empty()) continue;
        if (any_of(decl.begin(), decl.end(), [](const token &t) { return t.is(token_kind::IDENTIFIER, "typedef"); }))
            continue;

        for (const auto &declarator : split_declarators(decl)) {
            declarator_name name = find_declarator_name(declarator);
            if (!name.name || name.function) continue;
            if (is_exception(name.name->text)) {
                DLOG(INFO) << "Global variable '" << name.name->text << "' is allowed by an exception";
                continue;
            }
            return fmt::format("global variable '{}' on line {}", name.name->text, name.name->line);
        }
    }
    return nullopt;
}

vector<analysis_result> run_analysers(const string &source, const vector<analyser_uptr> &analysers) {
    vector<token> tokens = tokenize(source);
    vector<analysis_result> results;
    for (const auto &a : analysers)
        results.push_back(a->analyse(tokens));
    return results;
}

}  // namespace atst
