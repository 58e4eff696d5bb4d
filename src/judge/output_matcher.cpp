#include "judge/output_matcher.hpp"

namespace atst {
using namespace std;

expected_output expected_output::any() {
    expected_output result;
    result.wildcard = true;
    return result;
}

expected_output expected_output::literal(const string &text) {
    expected_output result;
    result.text = text;
    return result;
}

string normalize_line_endings(const string &str) {
    string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\r') {
            result.push_back('\n');
            if (i + 1 < str.size() && str[i + 1] == '\n') ++i;
        } else {
            result.push_back(str[i]);
        }
    }
    return result;
}

bool match_output(const optional<expected_output> &expected, const string &actual) {
    if (!expected || expected->wildcard) return true;
    return normalize_line_endings(expected->text) == normalize_line_endings(actual);
}

}  // namespace atst
