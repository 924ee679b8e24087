#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace coexec {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (std::exception &e) {
        LOG(ERROR) << "cleanup failed: " << e.what();
    }
}

void scoped_guard::dismiss() {
    f = nullptr;
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace coexec
