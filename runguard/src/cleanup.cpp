#include "cleanup.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <sys/types.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include "cgroup.hpp"

using namespace std;

static bool process_alive(pid_t pid) {
    return kill(pid, 0) == 0 || errno != ESRCH;
}

int cleanup_orphans(const string &metafile_path) {
    int removed = 0;
    filesystem::path parent = cgroup_directory(CONTEXT_CONTROLLERS.front(), CGROUP_PARENT);
    error_code ec;
    if (filesystem::is_directory(parent, ec)) {
        for (filesystem::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
            auto &entry = *it;
            error_code entry_ec;
            if (!entry.is_directory(entry_ec)) continue;

            pid_t owner;
            string leaf = entry.path().filename().string();
            if (!parse_context_cgroup_name(leaf, owner) || process_alive(owner)) continue;

            // cpuset 只在 runguard 使用了 --cpuset 时创建，按实际存在的层级删除
            string name = CGROUP_PARENT + "/" + leaf;
            vector<string> controllers;
            for (auto &controller : CONTEXT_CONTROLLERS)
                if (filesystem::is_directory(cgroup_directory(controller, name), entry_ec))
                    controllers.push_back(controller);

            try {
                context_cgroup cg(name, controllers);
                cg.adopt();
                size_t killed = cg.kill_tasks();
                cg.remove();
                ++removed;
                LOG(INFO) << "removed orphaned cgroup " << name << " and killed " << killed << " processes";
            } catch (exception &e) {
                LOG(ERROR) << "unable to remove orphaned cgroup " << name << ": " << e.what();
            }
        }
        if (ec) LOG(WARNING) << "unable to scan " << parent << ": " << ec.message();
    }

    if (!metafile_path.empty()) {
        ofstream metafile(metafile_path);
        metafile << "removed-cgroups: " << removed << endl;
    }
    return removed;
}
