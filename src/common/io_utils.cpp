#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <stdlib.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace atst {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to read file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw environment_error("unable to write file " + path.string());
    fout << content;
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("../") != string::npos || subpath == "..")
        throw configuration_error("path is not safe " + subpath);
    return subpath;
}

scoped_temp_directory::scoped_temp_directory() {}

scoped_temp_directory::scoped_temp_directory(const fs::path &parent, const string &prefix) {
    // 编译器和测试在这个文件夹中运行，相对路径在切换工作目录后会失效
    fs::path root = fs::absolute(parent);
    error_code ec;
    fs::create_directories(root, ec);
    if (ec)
        throw environment_error("unable to create work directory " + root.string() + ": " + ec.message());

    string tmpl = (root / (prefix + "-XXXXXX")).string();
    if (!mkdtemp(tmpl.data()))
        throw environment_error("unable to create temporary directory in " + root.string() + ": " + strerror(errno));
    dir = tmpl;
}

scoped_temp_directory::scoped_temp_directory(scoped_temp_directory &&other) {
    swap(dir, other.dir);
}

scoped_temp_directory::~scoped_temp_directory() {
    release();
}

scoped_temp_directory &scoped_temp_directory::operator=(scoped_temp_directory &&other) {
    swap(dir, other.dir);
    return *this;
}

const fs::path &scoped_temp_directory::path() const {
    return dir;
}

void scoped_temp_directory::release() {
    if (dir.empty()) return;
    if (DEBUG) {
        LOG(INFO) << "Keeping temporary directory " << dir;
    } else {
        error_code ec;
        fs::remove_all(dir, ec);
        if (ec) LOG(WARNING) << "Unable to remove temporary directory " << dir << ": " << ec.message();
    }
    dir.clear();
}

}  // namespace atst
