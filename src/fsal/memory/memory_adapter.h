#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "fsal/native_client.h"

namespace dfsio {

/**
 * 进程内的原生客户端实现，错误约定与 CephFsAdapter 相同（返回 -errno）。
 * 不做任何网络或磁盘操作，用于单元测试和本地调试。
 *
 * 同名挂载共享同一个卷：umount 之后再 mount 同名卷，数据仍然存在。
 * 提供若干故障注入开关，用来模拟原生层的短读、短写、分页等行为。
 */
class MemoryFsAdapter : public INativeClient {
public:
    MemoryFsAdapter();
    ~MemoryFsAdapter() override;

    MemoryFsAdapter(const MemoryFsAdapter&) = delete;
    MemoryFsAdapter& operator=(const MemoryFsAdapter&) = delete;

    // 单次 read/write 最多处理的字节数，0 表示不限制
    void set_max_io_chunk(size_t n);
    // 累计可写入的字节数，用尽后 write 返回 0；负数表示不限制
    void set_write_budget(long long bytes);
    // listdir 单页最多返回的条目数，0 表示只受调用方 max_entries 限制
    void set_listdir_page_size(size_t n);
    // 之后的 mount 都返回 -err，0 表示恢复正常
    void set_mount_error(int err);

    std::uint64_t native_calls() const { return calls_.load(); }
    std::uint64_t listdir_calls() const { return listdir_calls_.load(); }
    size_t open_fd_count() const;
    size_t mount_count() const;

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
    struct Node {
        std::uint32_t mode {0};
        std::uint64_t ino {0};
        std::uint32_t uid {0};
        std::uint32_t gid {0};
        std::uint64_t atime_ms {0};
        std::uint64_t mtime_ms {0};
        std::uint64_t ctime_ms {0};
        std::string data;      // 普通文件内容
        std::string target;    // 符号链接目标
        std::map<std::string, std::shared_ptr<Node>> children; // 目录项，按名字排序
        std::map<std::string, std::string> xattrs;
    };
    using NodePtr = std::shared_ptr<Node>;

    struct Volume {
        NodePtr root;
        std::uint64_t next_ino {2};
    };

    struct Mount {
        std::string name;
        Volume* vol {nullptr};
        bool read_only {false};
    };

    struct OpenFile {
        MountHandle h {kInvalidMountHandle};
        NodePtr node;
        int flags {0};
        std::uint64_t pos {0};
    };

    mutable std::mutex mu_;
    std::map<std::string, std::unique_ptr<Volume>> volumes_;
    std::unordered_map<MountHandle, Mount> mounts_;
    std::unordered_map<int, OpenFile> fds_;
    MountHandle next_handle_ {1};
    int next_fd_ {3};

    size_t max_io_chunk_ {0};
    long long write_budget_ {-1};
    size_t listdir_page_size_ {0};
    int mount_error_ {0};

    std::atomic<std::uint64_t> calls_ {0};
    std::atomic<std::uint64_t> listdir_calls_ {0};

    // 以下函数都要求已持有 mu_
    int mount_locked(MountHandle h, Mount*& m);
    int writable_mount_locked(MountHandle h, Mount*& m);
    int file_locked(MountHandle h, int fd, OpenFile*& of);
    int resolve_locked(Volume& vol, const std::string& path, bool follow_last,
                       NodePtr& out, int depth = 0);
    int resolve_parent_locked(Volume& vol, const std::string& path,
                              NodePtr& parent, std::string& leaf);
    NodePtr new_node_locked(Volume& vol, std::uint32_t mode);
    static void fill_stat(const Node& n, FileStat& st);
};

} // namespace dfsio
