#include "mount.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <cerrno>
#include <system_error>

using namespace std;

static void do_mount(const string &source, const string &target, const char *fstype, unsigned long flags, const string &data = "") {
    if (mount(source.empty() ? nullptr : source.c_str(), target.c_str(), fstype, flags, data.empty() ? nullptr : data.c_str()) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to mount {} at {}", source.empty() ? "-" : source, target));
}

/**
 * @brief 挂载点必须已经存在于模板中，只读的模板内无法再创建目录
 */
static void ensure_mount_point(const string &path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
        throw system_error(ENOENT, generic_category(), fmt::format("mount point {} does not exist in the image", path));
}

void setup_mounts(const struct runguard_options &opt) {
    if (opt.chroot_dir.empty()) return;

    do_mount("", "/", nullptr, MS_PRIVATE | MS_REC);

    // 只读的 chroot
    do_mount(opt.chroot_dir, opt.chroot_dir, nullptr, MS_BIND | MS_REC);
    do_mount(opt.chroot_dir, opt.chroot_dir, nullptr, MS_BIND | MS_REC | MS_REMOUNT | MS_RDONLY);

    if (!opt.scratch_dir.empty()) {
        string target = opt.chroot_dir + "/sandbox";
        ensure_mount_point(target);
        do_mount(opt.scratch_dir, target, nullptr, MS_BIND);
        do_mount(opt.scratch_dir, target, nullptr, MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NODEV);
        LOG(INFO) << "mounted scratch directory " << opt.scratch_dir;
    }

    if (opt.tmp_size >= 0) {
        string target = opt.chroot_dir + "/tmp";
        ensure_mount_point(target);
        do_mount("tmpfs", target, "tmpfs", MS_NOSUID | MS_NODEV | MS_NOEXEC, fmt::format("size={}m,mode=1777", opt.tmp_size));
    }

    string proc = opt.chroot_dir + "/proc";
    ensure_mount_point(proc);
    do_mount("proc", proc, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, "hidepid=2");
}
