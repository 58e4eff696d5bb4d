#include "judge/script.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "config.hpp"

namespace atst {
using namespace std;
namespace fs = std::filesystem;

string script_result::status() const {
    if (!started) return "error";
    return get_display_message(execution.how);
}

script_result run_script(const fs::path &script, const fs::path &cwd) {
    script_result result;
    result.script = script;

    run_options opt;
    opt.command = {fs::absolute(script).string()};
    opt.timeout = SCRIPT_TIMEOUT;
    opt.working_directory = cwd;
    opt.stream_size = STREAM_SIZE_LIMIT;

    try {
        result.execution = run_process(opt);
        result.started = true;
    } catch (spawn_error &ex) {
        result.error = ex.what();
        LOG(WARNING) << "Unable to run script " << script << ": " << ex.what();
        return result;
    }

    LOG(INFO) << "Script " << script.filename() << " in " << cwd << ": " << result.status()
              << (result.execution.exited() ? " with code " + to_string(result.execution.exitcode) : "");
    return result;
}

}  // namespace atst
