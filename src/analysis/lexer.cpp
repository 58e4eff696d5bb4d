#include "analysis/lexer.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cctype>
#include <cstring>
#include <unordered_set>

namespace atst {
using namespace std;

// clang-format off
static const unordered_set<string> keywords = {
    "auto", "break", "case", "char", "const", "continue", "default", "do", "double",
    "else", "enum", "extern", "float", "for", "goto", "if", "inline", "int", "long",
    "register", "restrict", "return", "short", "signed", "sizeof", "static", "struct",
    "switch", "typedef", "union", "unsigned", "void", "volatile", "while",
    "_Alignas", "_Alignof", "_Atomic", "_Bool", "_Complex", "_Generic", "_Imaginary",
    "_Noreturn", "_Static_assert", "_Thread_local",
    "__inline", "__inline__", "__restrict", "__restrict__", "__extension__", "__thread",
    "__const", "__volatile__", "__signed__"
};

static const char *punctuators[] = {
    "<<=", ">>=", "...",
    "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "##"
};
// clang-format on

bool token::is(token_kind k, const string &t) const {
    return kind == k && text == t;
}

bool token::is_punct(const string &t) const {
    return is(token_kind::PUNCT, t);
}

bool is_keyword(const string &identifier) {
    return keywords.count(identifier) > 0;
}

namespace {

struct lexer {
    const string &src;
    size_t pos = 0;
    int line = 1;
    bool line_start = true;
    vector<token> tokens;

    explicit lexer(const string &src) : src(src) {}

    bool eof() const { return pos >= src.size(); }

    char peek(size_t offset = 0) const {
        return pos + offset < src.size() ? src[pos + offset] : '\0';
    }

    /**
     * @brief 跳过续行符（反斜杠加换行）
     * @return 是否跳过了续行符
     */
    bool skip_line_continuation() {
        if (peek() != '\\') return false;
        if (peek(1) == '\n') {
            pos += 2;
        } else if (peek(1) == '\r' && peek(2) == '\n') {
            pos += 3;
        } else {
            return false;
        }
        ++line;
        return true;
    }

    void skip_line_comment() {
        while (!eof() && peek() != '\n') ++pos;
    }

    /**
     * @return 注释未闭合时返回 false
     */
    bool skip_block_comment() {
        pos += 2;
        while (!eof()) {
            if (peek() == '*' && peek(1) == '/') {
                pos += 2;
                return true;
            }
            if (peek() == '\n') ++line;
            ++pos;
        }
        return false;
    }

    /**
     * @brief 读取字符串或字符常量，结果追加到 text 中
     * 遇到换行时认为常量在本行结束
     * @return 到达文件末尾仍未闭合时返回 false
     */
    bool read_literal(string &text) {
        char quote = peek();
        text += quote;
        ++pos;
        while (!eof()) {
            char c = peek();
            if (c == '\\') {
                if (skip_line_continuation()) continue;
                text += c;
                ++pos;
                if (eof()) return false;
                text += peek();
                ++pos;
            } else if (c == quote) {
                text += c;
                ++pos;
                return true;
            } else if (c == '\n') {
                return true;
            } else {
                text += c;
                ++pos;
            }
        }
        return false;
    }

    /**
     * @return 指令中的注释或常量未闭合时返回 false
     */
    bool read_directive() {
        int start_line = line;
        string text;
        while (!eof()) {
            char c = peek();
            if (skip_line_continuation()) {
                text += ' ';
            } else if (c == '\n') {
                break;
            } else if (c == '/' && peek(1) == '/') {
                skip_line_comment();
            } else if (c == '/' && peek(1) == '*') {
                if (!skip_block_comment()) return false;
                text += ' ';
            } else if (c == '"' || c == '\'') {
                if (!read_literal(text)) return false;
            } else {
                text += c;
                ++pos;
            }
        }
        tokens.push_back({token_kind::PREPROCESSOR, boost::algorithm::trim_copy(text), start_line});
        return true;
    }

    void read_identifier() {
        size_t start = pos;
        while (!eof() && (isalnum((unsigned char)peek()) || peek() == '_')) ++pos;
        tokens.push_back({token_kind::IDENTIFIER, src.substr(start, pos - start), line});
    }

    void read_number() {
        size_t start = pos;
        while (!eof()) {
            char c = peek();
            if (isalnum((unsigned char)c) || c == '_' || c == '.') {
                ++pos;
            } else if ((c == '+' || c == '-') && pos > start && strchr("eEpP", src[pos - 1])) {
                ++pos;
            } else {
                break;
            }
        }
        tokens.push_back({token_kind::NUMBER, src.substr(start, pos - start), line});
    }

    void read_punctuator() {
        for (const char *p : punctuators) {
            if (src.compare(pos, strlen(p), p) == 0) {
                tokens.push_back({token_kind::PUNCT, p, line});
                pos += strlen(p);
                return;
            }
        }
        tokens.push_back({token_kind::PUNCT, string(1, peek()), line});
        ++pos;
    }

    void run() {
        while (!eof()) {
            char c = peek();
            if (c == '\n') {
                ++line;
                ++pos;
                line_start = true;
            } else if (isspace((unsigned char)c)) {
                ++pos;
            } else if (skip_line_continuation()) {
                continue;
            } else if (c == '/' && peek(1) == '/') {
                skip_line_comment();
            } else if (c == '/' && peek(1) == '*') {
                if (!skip_block_comment()) return;
            } else if (c == '#' && line_start) {
                if (!read_directive()) return;
            } else {
                line_start = false;
                if (isalpha((unsigned char)c) || c == '_') {
                    read_identifier();
                } else if (isdigit((unsigned char)c) || (c == '.' && isdigit((unsigned char)peek(1)))) {
                    read_number();
                } else if (c == '"' || c == '\'') {
                    int start_line = line;
                    string text;
                    if (!read_literal(text)) return;
                    tokens.push_back({c == '"' ? token_kind::STRING : token_kind::CHAR, text, start_line});
                } else {
                    read_punctuator();
                }
            }
        }
    }
};

}  // namespace

vector<token> tokenize(const string &source) {
    lexer lex(source);
    lex.run();
    return move(lex.tokens);
}

}  // namespace atst
