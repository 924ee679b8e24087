#include "cgroup.hpp"
#include <fmt/core.h>
#include <libcgroup.h>

namespace coexec::runguard {
using namespace std;

cgroup_error::cgroup_error(const string &operation, int err) {
    // ECGOTHER 表示真正的错误码在 errno 中
    int code = err == ECGOTHER ? cgroup_get_last_errno() : err;
    message = fmt::format("{}{}: {}", err == ECGOTHER ? "libcgroup: " : "", operation, cgroup_strerror(code));
}

const char *cgroup_error::what() const noexcept {
    return message.c_str();
}

void cgroup_error::check(const string &operation, int err) {
    if (err != 0) throw cgroup_error(operation, err);
}

void controller_ref::set(const string &name, int64_t value) {
    cgroup_error::check(fmt::format("set {} = {}", name, value),
                        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

void controller_ref::set(const string &name, const string &value) {
    cgroup_error::check(fmt::format("set {} = {}", name, value),
                        cgroup_add_value_string(ctrl, name.c_str(), value.c_str()));
}

int64_t controller_ref::get_int64(const string &name) const {
    int64_t value = 0;
    cgroup_error::check(fmt::format("get {}", name),
                        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

void control_group::init() {
    cgroup_error::check("cgroup_init", cgroup_init());
}

control_group::control_group(const string &name) {
    cg = cgroup_new_cgroup(name.c_str());
    if (!cg) throw cgroup_error(fmt::format("new cgroup {}", name), ECGOTHER);
}

control_group::~control_group() {
    cgroup_free(&cg);
}

controller_ref control_group::add_controller(const string &name) {
    struct cgroup_controller *ctrl = cgroup_add_controller(cg, name.c_str());
    if (!ctrl) throw cgroup_error(fmt::format("add controller {}", name), ECGOTHER);
    return {ctrl};
}

controller_ref control_group::controller(const string &name) {
    struct cgroup_controller *ctrl = cgroup_get_controller(cg, name.c_str());
    if (!ctrl) throw cgroup_error(fmt::format("get controller {}", name), ECGROUPNOTEXIST);
    return {ctrl};
}

void control_group::create() {
    cgroup_error::check("create cgroup", cgroup_create_cgroup(cg, 1));
}

void control_group::load() {
    cgroup_error::check("load cgroup", cgroup_get_cgroup(cg));
}

void control_group::attach_current() {
    cgroup_error::check("attach to cgroup", cgroup_attach_task(cg));
}

void control_group::remove() {
    cgroup_error::check("delete cgroup",
                        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

}  // namespace coexec::runguard
