#include "utils.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>

namespace coexec::runguard {
using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

int get_userid(const string &name) {
    errno = 0;
    struct passwd *pwd = getpwnam(name.c_str());
    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const string &name) {
    errno = 0;
    struct group *g = getgrnam(name.c_str());
    if (!g || errno) return -1;
    return (int)g->gr_gid;
}

}  // namespace coexec::runguard
