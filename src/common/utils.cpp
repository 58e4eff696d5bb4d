#include "common/utils.hpp"
#include <boost/algorithm/string.hpp>
#include <unistd.h>
#include <cstdlib>

namespace atst {
using namespace std;
namespace fs = std::filesystem;

string join_command(const vector<string> &command) {
    return boost::algorithm::join(command, " ");
}

vector<string> split_whitespace(const string &str) {
    vector<string> result;
    string trimmed = boost::algorithm::trim_copy(str);
    if (trimmed.empty()) return result;
    boost::algorithm::split(result, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return result;
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

optional<fs::path> find_executable(const string &name) {
    if (name.empty()) return nullopt;
    if (name.find('/') != string::npos) {
        if (is_executable_file(name)) return fs::path(name);
        return nullopt;
    }

    vector<string> dirs;
    string path_env = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::algorithm::split(dirs, path_env, boost::algorithm::is_any_of(":"));
    for (auto &dir : dirs) {
        // PATH 中的空项表示当前目录
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / name;
        if (is_executable_file(candidate)) return candidate;
    }
    return nullopt;
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return duration<chrono::duration<double>>().count();
}

}  // namespace atst
