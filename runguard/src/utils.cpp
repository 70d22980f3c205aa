#include "utils.hpp"
#include <grp.h>
#include <pwd.h>
#include <algorithm>
#include <stdexcept>

using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

int get_userid(const char *name) {
    struct passwd *pwd = getpwnam(name);
    if (!pwd) throw runtime_error(string("unknown user ") + name);
    return (int)pwd->pw_uid;
}

int get_groupid(const char *name) {
    struct group *grp = getgrnam(name);
    if (!grp) throw runtime_error(string("unknown group ") + name);
    return (int)grp->gr_gid;
}
