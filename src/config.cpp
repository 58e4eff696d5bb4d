#include "config.hpp"

namespace atst {
using namespace std;

chrono::milliseconds DEFAULT_TEST_TIMEOUT(5000);
chrono::milliseconds COMPILE_TIMEOUT(60 * 1000);
chrono::milliseconds SCRIPT_TIMEOUT(60 * 1000);
long long STREAM_SIZE_LIMIT = 16LL << 20;  // 16M

filesystem::path WORK_DIR;
bool DEBUG = false;

}  // namespace atst
