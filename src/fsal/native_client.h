#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/types.h"
#include "config/config_loader.h"

namespace dfsio {

/**
 * 原生文件系统客户端调用边界。
 *
 * 约定（与 libcephfs 一致）：
 *   - 所有调用同步阻塞，没有超时；
 *   - 返回值 >= 0 表示成功，< 0 表示失败，值为 -errno；
 *   - 除 mount 返回的句柄和 open 返回的 fd 外不保存状态。
 *
 * 同一个 mount 上不同 fd 的并发调用由实现保证安全；
 * 同一个 fd 上的并发调用需要调用方自行串行化。
 */
class INativeClient {
public:
    virtual ~INativeClient() = default;

    // 成功返回 > 0 的挂载句柄
    virtual MountHandle mount(const std::string& name, const MountConfig& cfg) = 0;
    virtual int umount(MountHandle h) = 0;

    // 成功返回 fd；path 为目录时返回 -EISDIR
    virtual int open(MountHandle h, const std::string& path, int flags,
                     std::uint32_t mode) = 0;
    virtual int close(MountHandle h, int fd) = 0;

    // 在当前文件位置读写，返回实际字节数，可能小于 len；读到 EOF 返回 0
    virtual long read(MountHandle h, int fd, char* buf, size_t len) = 0;
    virtual long write(MountHandle h, int fd, const char* buf, size_t len) = 0;
    // 从 offset 处读取，不改变 fd 的当前位置
    virtual long pread(MountHandle h, int fd, char* buf, size_t len,
                       std::uint64_t offset) = 0;
    // 返回新的绝对位置
    virtual std::int64_t lseek(MountHandle h, int fd, std::int64_t offset,
                               int whence) = 0;
    virtual int fsync(MountHandle h, int fd, bool data_only) = 0;
    virtual int ftruncate(MountHandle h, int fd, std::uint64_t length) = 0;
    virtual int fstat(MountHandle h, int fd, FileStat& st) = 0;

    virtual int stat(MountHandle h, const std::string& path, FileStat& st) = 0;
    virtual int lstat(MountHandle h, const std::string& path, FileStat& st) = 0;
    virtual int statvfs(MountHandle h, StatVfs& out) = 0;

    virtual int mkdir(MountHandle h, const std::string& path, std::uint32_t mode) = 0;
    virtual int rmdir(MountHandle h, const std::string& path) = 0;
    virtual int unlink(MountHandle h, const std::string& path) = 0;
    virtual int rename(MountHandle h, const std::string& src,
                       const std::string& dst) = 0;
    virtual int symlink(MountHandle h, const std::string& target,
                        const std::string& link_path) = 0;
    virtual int readlink(MountHandle h, const std::string& path,
                         std::string& target) = 0;

    virtual int chmod(MountHandle h, const std::string& path, std::uint32_t mode) = 0;
    virtual int chown(MountHandle h, const std::string& path,
                      std::uint32_t uid, std::uint32_t gid) = 0;
    virtual int truncate(MountHandle h, const std::string& path,
                         std::uint64_t length) = 0;
    virtual int utime(MountHandle h, const std::string& path,
                      std::uint64_t atime_ms, std::uint64_t mtime_ms) = 0;

    /**
     * 分页列目录。cookie 为 0 表示从头开始；
     * 成功时返回本页条目数，并设置 next_cookie 供下一页使用，
     * next_cookie 为 0 表示没有更多条目。"." 和 ".." 不返回。
     */
    virtual int listdir(MountHandle h, const std::string& path,
                        std::uint64_t cookie, size_t max_entries,
                        std::vector<DirEntry>& out,
                        std::uint64_t& next_cookie) = 0;

    // 属性不存在时返回 -ENODATA
    virtual int getxattr(MountHandle h, const std::string& path,
                         const std::string& name, std::string& value) = 0;
    virtual int setxattr(MountHandle h, const std::string& path,
                         const std::string& name, const std::string& value,
                         int flags) = 0;
    virtual int removexattr(MountHandle h, const std::string& path,
                            const std::string& name) = 0;
    virtual int listxattr(MountHandle h, const std::string& path,
                          std::vector<std::string>& names) = 0;
};

} // namespace dfsio
