#include "common/system.hpp"
#include <errno.h>
#include <grp.h>
#include <pwd.h>
#include <sys/types.h>
#include <algorithm>
#include <cctype>

using namespace std;

static bool is_id(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

int get_userid(const string &user) {
    if (is_id(user)) return stoi(user);

    errno = 0;
    struct passwd *pwd = getpwnam(user.c_str());

    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const string &group) {
    if (is_id(group)) return stoi(group);

    errno = 0;
    struct group *g = getgrnam(group.c_str());

    if (!g || errno) return -1;
    return (int)g->gr_gid;
}

int get_primary_groupid(const string &user) {
    errno = 0;
    struct passwd *pwd = is_id(user) ? getpwuid(stoi(user)) : getpwnam(user.c_str());

    if (!pwd || errno) return -1;
    return (int)pwd->pw_gid;
}
