#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace atst {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数中不能再抛出异常，否则正在传播的异常会直接导致 terminate
    try {
        f();
    } catch (std::exception &e) {
        LOG(ERROR) << "Exception thrown in deferred cleanup: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace atst
