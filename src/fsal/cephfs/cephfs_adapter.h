#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <cephfs/libcephfs.h>

#include "fsal/native_client.h"

namespace dfsio {

/**
 * 基于 libcephfs 的原生客户端。
 * 每个挂载句柄对应一个 ceph_mount_info；MountConfig 的映射：
 *   meta          -> mon_host
 *   user          -> cephx id（ceph_create 的 id）
 *   keyring       -> keyring
 *   cache_size_mb -> client_oc_size
 *   root          -> ceph_mount 的子树
 *   options       -> 逐项 ceph_conf_set
 * read_only 在本层实现：修改类调用返回 -EROFS。
 */
class CephFsAdapter : public INativeClient {
public:
    CephFsAdapter();
    ~CephFsAdapter() override;

    CephFsAdapter(const CephFsAdapter&) = delete;
    CephFsAdapter& operator=(const CephFsAdapter&) = delete;

    MountHandle mount(const std::string& name, const MountConfig& cfg) override;
    int umount(MountHandle h) override;

    int open(MountHandle h, const std::string& path, int flags,
             std::uint32_t mode) override;
    int close(MountHandle h, int fd) override;

    long read(MountHandle h, int fd, char* buf, size_t len) override;
    long write(MountHandle h, int fd, const char* buf, size_t len) override;
    long pread(MountHandle h, int fd, char* buf, size_t len,
               std::uint64_t offset) override;
    std::int64_t lseek(MountHandle h, int fd, std::int64_t offset,
                       int whence) override;
    int fsync(MountHandle h, int fd, bool data_only) override;
    int ftruncate(MountHandle h, int fd, std::uint64_t length) override;
    int fstat(MountHandle h, int fd, FileStat& st) override;

    int stat(MountHandle h, const std::string& path, FileStat& st) override;
    int lstat(MountHandle h, const std::string& path, FileStat& st) override;
    int statvfs(MountHandle h, StatVfs& out) override;

    int mkdir(MountHandle h, const std::string& path, std::uint32_t mode) override;
    int rmdir(MountHandle h, const std::string& path) override;
    int unlink(MountHandle h, const std::string& path) override;
    int rename(MountHandle h, const std::string& src,
               const std::string& dst) override;
    int symlink(MountHandle h, const std::string& target,
                const std::string& link_path) override;
    int readlink(MountHandle h, const std::string& path,
                 std::string& target) override;

    int chmod(MountHandle h, const std::string& path, std::uint32_t mode) override;
    int chown(MountHandle h, const std::string& path,
              std::uint32_t uid, std::uint32_t gid) override;
    int truncate(MountHandle h, const std::string& path,
                 std::uint64_t length) override;
    int utime(MountHandle h, const std::string& path,
              std::uint64_t atime_ms, std::uint64_t mtime_ms) override;

    int listdir(MountHandle h, const std::string& path,
                std::uint64_t cookie, size_t max_entries,
                std::vector<DirEntry>& out,
                std::uint64_t& next_cookie) override;

    int getxattr(MountHandle h, const std::string& path,
                 const std::string& name, std::string& value) override;
    int setxattr(MountHandle h, const std::string& path,
                 const std::string& name, const std::string& value,
                 int flags) override;
    int removexattr(MountHandle h, const std::string& path,
                    const std::string& name) override;
    int listxattr(MountHandle h, const std::string& path,
                  std::vector<std::string>& names) override;

private:
    struct Mount {
        std::string name;
        ceph_mount_info* cm {nullptr};
        bool read_only {false};
    };

    std::mutex mu_;
    std::unordered_map<MountHandle, Mount> mounts_;
    MountHandle next_handle_ {1};

    // 找不到句柄时返回 -EBADF
    int lookup(MountHandle h, ceph_mount_info*& cm, bool* read_only = nullptr);
    int lookup_writable(MountHandle h, ceph_mount_info*& cm);
    int do_stat(MountHandle h, const std::string& path, FileStat& st,
                unsigned int flags);
};

} // namespace dfsio
