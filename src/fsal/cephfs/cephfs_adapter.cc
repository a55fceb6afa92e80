// fsal/cephfs/cephfs_adapter.cc
#include "fsal/cephfs/cephfs_adapter.h"
#include "common/logging.h"

#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/time.h>
#include <sys/types.h>
#include <dirent.h>

namespace dfsio {

namespace {

// ENOENT / EEXIST / ENODATA 是调用方常见的正常分支，只打 DEBUG
void log_failure(const char* call, const std::string& path, long rc) {
    int err = static_cast<int>(-rc);
    LogLevel level = (err == ENOENT || err == EEXIST || err == ENODATA)
                         ? LogLevel::DEBUG
                         : LogLevel::ERROR;
    log(level, "%s path=%s rc=%ld (%s)", call, path.c_str(), rc,
        std::strerror(err));
}

std::uint64_t to_ms(const struct timespec& ts) {
    return static_cast<std::uint64_t>(ts.tv_sec) * 1000 +
           static_cast<std::uint64_t>(ts.tv_nsec) / 1000000;
}

void fill_stat(const struct ceph_statx& stx, FileStat& st) {
    st.mode = stx.stx_mode;
    st.size = stx.stx_size;
    st.uid = stx.stx_uid;
    st.gid = stx.stx_gid;
    st.nlink = stx.stx_nlink;
    st.ino = stx.stx_ino;
    st.atime_ms = to_ms(stx.stx_atime);
    st.mtime_ms = to_ms(stx.stx_mtime);
    st.ctime_ms = to_ms(stx.stx_ctime);
}

bool is_write_open(int flags) {
    int acc = flags & O_ACCMODE;
    return acc == O_WRONLY || acc == O_RDWR || (flags & (O_CREAT | O_TRUNC)) != 0;
}

std::string child_path(const std::string& dir, const char* name) {
    if (!dir.empty() && dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

} // namespace

CephFsAdapter::CephFsAdapter() = default;

CephFsAdapter::~CephFsAdapter() {
    std::lock_guard<std::mutex> g(mu_);
    for (auto& [h, m] : mounts_) {
        log(LogLevel::WARN, "CephFsAdapter: mount %s (handle=%ld) still active at destruction",
            m.name.c_str(), static_cast<long>(h));
        int rc = ceph_unmount(m.cm);
        if (rc < 0) {
            log(LogLevel::ERROR, "ceph_unmount failed rc=%d", rc);
        }
        ceph_release(m.cm);
    }
    mounts_.clear();
}

int CephFsAdapter::lookup(MountHandle h, ceph_mount_info*& cm, bool* read_only) {
    std::lock_guard<std::mutex> g(mu_);
    auto it = mounts_.find(h);
    if (it == mounts_.end()) {
        return -EBADF;
    }
    cm = it->second.cm;
    if (read_only) {
        *read_only = it->second.read_only;
    }
    return 0;
}

int CephFsAdapter::lookup_writable(MountHandle h, ceph_mount_info*& cm) {
    bool ro = false;
    int rc = lookup(h, cm, &ro);
    if (rc < 0) return rc;
    return ro ? -EROFS : 0;
}

MountHandle CephFsAdapter::mount(const std::string& name, const MountConfig& cfg) {
    ceph_mount_info* cm = nullptr;
    const char* id = cfg.user().empty() ? nullptr : cfg.user().c_str();
    int ret = ceph_create(&cm, id);
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_create failed rc=%d (%s)", ret, std::strerror(-ret));
        return ret;
    }

    ret = ceph_conf_read_file(cm, nullptr);
    if (ret < 0) {
        // 没有 ceph.conf 时全部依赖下面显式设置的选项
        log(LogLevel::DEBUG, "ceph_conf_read_file rc=%d, continue with explicit options", ret);
    }

    auto conf_set = [&](const char* key, const std::string& value) -> int {
        int rc = ceph_conf_set(cm, key, value.c_str());
        if (rc < 0) {
            log(LogLevel::ERROR, "ceph_conf_set %s=%s rc=%d (%s)",
                key, value.c_str(), rc, std::strerror(-rc));
        }
        return rc;
    };

    ret = conf_set("mon_host", cfg.meta());
    if (ret == 0 && !cfg.keyring().empty()) {
        ret = conf_set("keyring", cfg.keyring());
    }
    if (ret == 0 && cfg.cache_size_mb() > 0) {
        ret = conf_set("client_oc_size",
                       std::to_string(cfg.cache_size_mb() * 1024 * 1024));
    }
    if (ret == 0) {
        for (const auto& [key, value] : cfg.options()) {
            ret = conf_set(key.c_str(), value);
            if (ret < 0) break;
        }
    }
    if (ret < 0) {
        ceph_release(cm);
        return ret;
    }
    if (!cfg.cache_dir().empty()) {
        log(LogLevel::DEBUG, "cache_dir=%s is not used by libcephfs", cfg.cache_dir().c_str());
    }

    ret = ceph_init(cm);
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_init failed rc=%d (%s)", ret, std::strerror(-ret));
        ceph_shutdown(cm);
        return ret;
    }

    const std::string root = cfg.root().empty() ? "/" : cfg.root();
    ret = ceph_mount(cm, root.c_str());
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_mount root=%s failed rc=%d (%s)",
            root.c_str(), ret, std::strerror(-ret));
        ceph_shutdown(cm);
        return ret;
    }

    std::lock_guard<std::mutex> g(mu_);
    MountHandle h = next_handle_++;
    mounts_[h] = Mount{name, cm, cfg.read_only()};
    log(LogLevel::INFO, "CephFsAdapter mounted name=%s mon_host=%s root=%s handle=%ld",
        name.c_str(), cfg.meta().c_str(), root.c_str(), static_cast<long>(h));
    return h;
}

int CephFsAdapter::umount(MountHandle h) {
    Mount m;
    {
        std::lock_guard<std::mutex> g(mu_);
        auto it = mounts_.find(h);
        if (it == mounts_.end()) {
            return -EBADF;
        }
        m = it->second;
        mounts_.erase(it);
    }

    int rc = ceph_unmount(m.cm);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_unmount name=%s rc=%d (%s)",
            m.name.c_str(), rc, std::strerror(-rc));
    }
    ceph_release(m.cm);
    log(LogLevel::INFO, "CephFsAdapter unmounted name=%s", m.name.c_str());
    return rc < 0 ? rc : 0;
}

int CephFsAdapter::open(MountHandle h, const std::string& path, int flags,
                        std::uint32_t mode) {
    ceph_mount_info* cm = nullptr;
    int rc = is_write_open(flags) ? lookup_writable(h, cm) : lookup(h, cm);
    if (rc < 0) return rc;

    int fd = ceph_open(cm, path.c_str(), flags, static_cast<mode_t>(mode));
    if (fd < 0) {
        log_failure("ceph_open", path, fd);
        return fd;
    }

    // 只读打开目录在 cephfs 上会成功，这里统一成 EISDIR
    struct ceph_statx stx {};
    rc = ceph_fstatx(cm, fd, &stx, CEPH_STATX_MODE, 0);
    if (rc == 0 && S_ISDIR(stx.stx_mode)) {
        ceph_close(cm, fd);
        return -EISDIR;
    }
    return fd;
}

int CephFsAdapter::close(MountHandle h, int fd) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    rc = ceph_close(cm, fd);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_close fd=%d rc=%d (%s)",
            fd, rc, std::strerror(-rc));
        return rc;
    }
    return 0;
}

long CephFsAdapter::read(MountHandle h, int fd, char* buf, size_t len) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    // offset < 0 表示使用 fd 当前位置
    int ret = ceph_read(cm, fd, buf, static_cast<int64_t>(len), -1);
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_read fd=%d rc=%d (%s)",
            fd, ret, std::strerror(-ret));
    }
    return ret;
}

long CephFsAdapter::pread(MountHandle h, int fd, char* buf, size_t len,
                          std::uint64_t offset) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    int ret = ceph_read(cm, fd, buf, static_cast<int64_t>(len),
                        static_cast<int64_t>(offset));
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_read fd=%d offset=%llu rc=%d (%s)",
            fd, static_cast<unsigned long long>(offset), ret, std::strerror(-ret));
    }
    return ret;
}

long CephFsAdapter::write(MountHandle h, int fd, const char* buf, size_t len) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    int ret = ceph_write(cm, fd, buf, static_cast<int64_t>(len), -1);
    if (ret < 0) {
        log(LogLevel::ERROR, "ceph_write fd=%d rc=%d (%s)",
            fd, ret, std::strerror(-ret));
    }
    return ret;
}

std::int64_t CephFsAdapter::lseek(MountHandle h, int fd, std::int64_t offset,
                                  int whence) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    int64_t pos = ceph_lseek(cm, fd, offset, whence);
    if (pos < 0) {
        log(LogLevel::ERROR, "ceph_lseek fd=%d offset=%ld whence=%d rc=%ld",
            fd, static_cast<long>(offset), whence, static_cast<long>(pos));
    }
    return pos;
}

int CephFsAdapter::fsync(MountHandle h, int fd, bool data_only) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    rc = ceph_fsync(cm, fd, data_only ? 1 : 0);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_fsync fd=%d rc=%d (%s)", fd, rc, std::strerror(-rc));
    }
    return rc;
}

int CephFsAdapter::ftruncate(MountHandle h, int fd, std::uint64_t length) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    rc = ceph_ftruncate(cm, fd, static_cast<int64_t>(length));
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_ftruncate fd=%d rc=%d (%s)", fd, rc, std::strerror(-rc));
    }
    return rc;
}

int CephFsAdapter::fstat(MountHandle h, int fd, FileStat& st) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    struct ceph_statx stx {};
    rc = ceph_fstatx(cm, fd, &stx, CEPH_STATX_BASIC_STATS, 0);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_fstatx fd=%d rc=%d (%s)", fd, rc, std::strerror(-rc));
        return rc;
    }
    fill_stat(stx, st);
    return 0;
}

int CephFsAdapter::do_stat(MountHandle h, const std::string& path, FileStat& st,
                           unsigned int flags) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    struct ceph_statx stx {};
    rc = ceph_statx(cm, path.c_str(), &stx, CEPH_STATX_BASIC_STATS, flags);
    if (rc < 0) {
        log_failure("ceph_statx", path, rc);
        return rc;
    }
    fill_stat(stx, st);
    return 0;
}

int CephFsAdapter::stat(MountHandle h, const std::string& path, FileStat& st) {
    return do_stat(h, path, st, 0);
}

int CephFsAdapter::lstat(MountHandle h, const std::string& path, FileStat& st) {
    return do_stat(h, path, st, AT_SYMLINK_NOFOLLOW);
}

int CephFsAdapter::statvfs(MountHandle h, StatVfs& out) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    struct statvfs buf {};
    rc = ceph_statfs(cm, "/", &buf);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_statfs rc=%d (%s)", rc, std::strerror(-rc));
        return rc;
    }
    out.block_size = buf.f_frsize ? buf.f_frsize : buf.f_bsize;
    out.blocks = buf.f_blocks;
    out.blocks_free = buf.f_bfree;
    out.blocks_avail = buf.f_bavail;
    out.files = buf.f_files;
    out.files_free = buf.f_ffree;
    out.name_max = buf.f_namemax;
    return 0;
}

int CephFsAdapter::mkdir(MountHandle h, const std::string& path, std::uint32_t mode) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_mkdir(cm, path.c_str(), static_cast<mode_t>(mode));
    if (rc < 0) {
        log_failure("ceph_mkdir", path, rc);
    }
    return rc;
}

int CephFsAdapter::rmdir(MountHandle h, const std::string& path) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_rmdir(cm, path.c_str());
    if (rc < 0) {
        log_failure("ceph_rmdir", path, rc);
    }
    return rc;
}

int CephFsAdapter::unlink(MountHandle h, const std::string& path) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_unlink(cm, path.c_str());
    if (rc < 0) {
        log_failure("ceph_unlink", path, rc);
    }
    return rc;
}

int CephFsAdapter::rename(MountHandle h, const std::string& src,
                          const std::string& dst) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_rename(cm, src.c_str(), dst.c_str());
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_rename %s -> %s rc=%d (%s)",
            src.c_str(), dst.c_str(), rc, std::strerror(-rc));
    }
    return rc;
}

int CephFsAdapter::symlink(MountHandle h, const std::string& target,
                           const std::string& link_path) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_symlink(cm, target.c_str(), link_path.c_str());
    if (rc < 0) {
        log_failure("ceph_symlink", link_path, rc);
    }
    return rc;
}

int CephFsAdapter::readlink(MountHandle h, const std::string& path,
                            std::string& target) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    std::vector<char> buf(PATH_MAX);
    int n = ceph_readlink(cm, path.c_str(), buf.data(),
                          static_cast<int64_t>(buf.size()));
    if (n < 0) {
        log_failure("ceph_readlink", path, n);
        return n;
    }
    target.assign(buf.data(), static_cast<size_t>(n));
    return 0;
}

int CephFsAdapter::chmod(MountHandle h, const std::string& path, std::uint32_t mode) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_chmod(cm, path.c_str(), static_cast<mode_t>(mode));
    if (rc < 0) {
        log_failure("ceph_chmod", path, rc);
    }
    return rc;
}

int CephFsAdapter::chown(MountHandle h, const std::string& path,
                         std::uint32_t uid, std::uint32_t gid) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_chown(cm, path.c_str(), static_cast<int>(uid), static_cast<int>(gid));
    if (rc < 0) {
        log_failure("ceph_chown", path, rc);
    }
    return rc;
}

int CephFsAdapter::truncate(MountHandle h, const std::string& path,
                            std::uint64_t length) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_truncate(cm, path.c_str(), static_cast<int64_t>(length));
    if (rc < 0) {
        log_failure("ceph_truncate", path, rc);
    }
    return rc;
}

int CephFsAdapter::utime(MountHandle h, const std::string& path,
                         std::uint64_t atime_ms, std::uint64_t mtime_ms) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    struct timeval times[2];
    times[0].tv_sec = static_cast<time_t>(atime_ms / 1000);
    times[0].tv_usec = static_cast<suseconds_t>((atime_ms % 1000) * 1000);
    times[1].tv_sec = static_cast<time_t>(mtime_ms / 1000);
    times[1].tv_usec = static_cast<suseconds_t>((mtime_ms % 1000) * 1000);

    rc = ceph_utimes(cm, path.c_str(), times);
    if (rc < 0) {
        log_failure("ceph_utimes", path, rc);
    }
    return rc;
}

int CephFsAdapter::listdir(MountHandle h, const std::string& path,
                           std::uint64_t cookie, size_t max_entries,
                           std::vector<DirEntry>& out,
                           std::uint64_t& next_cookie) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    out.clear();
    next_cookie = 0;

    struct ceph_dir_result* dirp = nullptr;
    rc = ceph_opendir(cm, path.c_str(), &dirp);
    if (rc < 0) {
        // ceph_* 系列一般返回 -errno
        log_failure("ceph_opendir", path, rc);
        return rc;
    }

    if (cookie != 0) {
        ceph_seekdir(cm, dirp, static_cast<int64_t>(cookie));
    }

    bool more = false;
    while (true) {
        if (max_entries > 0 && out.size() >= max_entries) {
            // 还有没读的条目，记录下一页的起点
            more = true;
            break;
        }

        struct dirent* de = ceph_readdir(cm, dirp);
        if (!de) {
            // NULL 表示读到目录末尾
            break;
        }

        const char* name = de->d_name;
        if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0)
            continue;

        struct ceph_statx stx {};
        std::string child = child_path(path, name);
        int src = ceph_statx(cm, child.c_str(), &stx, CEPH_STATX_BASIC_STATS,
                             AT_SYMLINK_NOFOLLOW);
        if (src == -ENOENT) {
            // 列目录期间被删除
            continue;
        }
        if (src < 0) {
            log_failure("ceph_statx", child, src);
            ceph_closedir(cm, dirp);
            return src;
        }

        DirEntry e;
        e.name = name;
        fill_stat(stx, e.stat);
        e.kind = e.stat.kind();
        out.push_back(std::move(e));
    }

    if (more) {
        next_cookie = static_cast<std::uint64_t>(ceph_telldir(cm, dirp));
    }

    rc = ceph_closedir(cm, dirp);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_closedir path=%s rc=%d (%s)",
            path.c_str(), rc, std::strerror(-rc));
        return rc;
    }

    return static_cast<int>(out.size());
}

int CephFsAdapter::getxattr(MountHandle h, const std::string& path,
                            const std::string& name, std::string& value) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    // Step 1: 获取 xattr 的大小
    int sz = ceph_getxattr(cm, path.c_str(), name.c_str(), nullptr, 0);
    if (sz < 0) {
        log_failure("ceph_getxattr(size)", path, sz);
        return sz;
    }

    // Step 2: 预分配 buffer 并读取值
    value.resize(static_cast<size_t>(sz));
    int sz2 = ceph_getxattr(cm, path.c_str(), name.c_str(),
                            value.data(), value.size());
    if (sz2 < 0) {
        log_failure("ceph_getxattr(read)", path, sz2);
        return sz2;
    }

    if (static_cast<size_t>(sz2) != value.size()) {
        value.resize(static_cast<size_t>(sz2));
    }
    return 0;
}

int CephFsAdapter::setxattr(MountHandle h, const std::string& path,
                            const std::string& name, const std::string& value,
                            int flags) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_setxattr(cm, path.c_str(), name.c_str(),
                       value.data(), value.size(), flags);
    if (rc < 0) {
        log(LogLevel::ERROR, "ceph_setxattr path=%s name=%s rc=%d (%s)",
            path.c_str(), name.c_str(), rc, std::strerror(-rc));
    }
    return rc;
}

int CephFsAdapter::removexattr(MountHandle h, const std::string& path,
                               const std::string& name) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup_writable(h, cm);
    if (rc < 0) return rc;

    rc = ceph_removexattr(cm, path.c_str(), name.c_str());
    if (rc < 0) {
        log_failure("ceph_removexattr", path, rc);
    }
    return rc;
}

int CephFsAdapter::listxattr(MountHandle h, const std::string& path,
                             std::vector<std::string>& names) {
    ceph_mount_info* cm = nullptr;
    int rc = lookup(h, cm);
    if (rc < 0) return rc;

    int sz = ceph_listxattr(cm, path.c_str(), nullptr, 0);
    if (sz < 0) {
        log_failure("ceph_listxattr(size)", path, sz);
        return sz;
    }

    std::vector<char> buf(static_cast<size_t>(sz));
    int sz2 = sz > 0 ? ceph_listxattr(cm, path.c_str(), buf.data(), buf.size()) : 0;
    if (sz2 < 0) {
        log_failure("ceph_listxattr(read)", path, sz2);
        return sz2;
    }

    // 以 '\0' 分隔的名字列表
    names.clear();
    size_t start = 0;
    for (size_t i = 0; i < static_cast<size_t>(sz2); ++i) {
        if (buf[i] == '\0') {
            if (i > start) {
                names.emplace_back(buf.data() + start, i - start);
            }
            start = i + 1;
        }
    }
    return 0;
}

} // namespace dfsio
