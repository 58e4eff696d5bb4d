#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace atst {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::SEGMENTATION_FAULT, "Segmentation Fault")
    (status::FLOATING_POINT_ERROR, "Floating Point Error")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace atst
