#include "judge/compiler.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"
#include "config.hpp"
#include "process/run.hpp"

namespace atst {
using namespace std;
namespace fs = std::filesystem;

compilation_error::compilation_error(const string &what, const string &error_log)
    : atst_exception(what), error_log(error_log) {}

void check_compiler(const compiler_options &options) {
    if (!find_executable(options.cc))
        throw environment_error(fmt::format("compiler '{}' not found", options.cc));
}

/**
 * @brief 执行一步编译命令，失败时抛出 compilation_error
 * @param log 编译器的输出会追加到这里
 */
static void run_compile_step(const vector<string> &command, const fs::path &cwd, string &log) {
    run_options opt;
    opt.command = command;
    opt.timeout = COMPILE_TIMEOUT;
    opt.working_directory = cwd;
    opt.stream_size = STREAM_SIZE_LIMIT;

    execution_result result;
    try {
        result = run_process(opt);
    } catch (spawn_error &ex) {
        throw compilation_error(ex.what(), log);
    }

    log += result.out;
    log += result.err;

    if (result.timed_out())
        throw compilation_error(fmt::format("compilation timed out after {}ms", COMPILE_TIMEOUT.count()), log);
    if (result.signaled())
        throw compilation_error(fmt::format("'{}' terminated with signal {}", command[0], result.signal), log);
    if (result.exitcode != 0)
        throw compilation_error(fmt::format("'{}' exited with code {}", command[0], result.exitcode), log);
}

compile_result compile_solution(const string &name, const fs::path &source, const compiler_options &options) {
    compile_result result;
    result.build_dir = scoped_temp_directory(WORK_DIR, name);
    const fs::path &dir = result.build_dir.path();

    fs::path source_path = fs::absolute(source);
    string stem = source_path.stem().string();
    fs::path object = dir / (stem + ".o");
    fs::path executable = dir / stem;

    try {
        if (!fs::is_regular_file(source_path))
            throw compilation_error(fmt::format("source file {} not found", source_path), "");

        run_compile_step(make_command(options.cc, options.cflags, "-c", source_path, "-o", object), dir, result.log);
        run_compile_step(make_command(options.cc, object, options.ldflags, "-o", executable), dir, result.log);

        result.success = true;
        result.executable = executable;
    } catch (compilation_error &ex) {
        result.success = false;
        string what = ex.what();
        result.log = (what.empty() ? "" : what + "\n") + ex.error_log;
        LOG(WARNING) << "Compilation of " << source_path << " failed: " << what;
    }
    return result;
}

}  // namespace atst
