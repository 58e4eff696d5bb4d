#include "project/discovery.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"

namespace atst {
using namespace std;
namespace fs = std::filesystem;

static solution make_solution(const fs::path &dir, const string &source) {
    solution sol;
    sol.name = dir.filename().string();
    sol.path = dir;
    sol.source = dir / source;
    sol.source_found = fs::is_regular_file(sol.source);
    return sol;
}

vector<solution> discover_solutions(const fs::path &project, const string &source, const vector<string> &exclude_dirs) {
    vector<fs::path> dirs;
    error_code ec;
    for (fs::directory_iterator it(project, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory()) continue;
        string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (find(exclude_dirs.begin(), exclude_dirs.end(), name) != exclude_dirs.end()) {
            DLOG(INFO) << "Skipping excluded directory " << name;
            continue;
        }
        dirs.push_back(it->path());
    }
    if (ec)
        throw environment_error(fmt::format("unable to read project directory {}: {}", project.string(), ec.message()));

    sort(dirs.begin(), dirs.end());

    vector<solution> result;
    for (auto &dir : dirs)
        result.push_back(make_solution(dir, source));
    return result;
}

vector<solution> discover_solution(const fs::path &project, const string &source, const string &name) {
    fs::path dir = project / name;
    if (!fs::is_directory(dir)) {
        LOG(WARNING) << "Solution " << name << " does not exist in " << project;
        return {};
    }
    return {make_solution(dir, source)};
}

}  // namespace atst
