#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/status.h"
#include "common/types.h"
#include "core/namespace/dir_reader.h"
#include "core/session/session.h"

namespace dfsio {

/**
 * walk 的回调：dirpath 为当前目录，dirs / files 为目录项名字。
 * 自顶向下遍历时可以修改 dirs 来剪枝；返回非 OK 会终止遍历并原样返回。
 */
using WalkVisitor = std::function<Status(const std::string& dirpath,
                                         std::vector<std::string>& dirs,
                                         const std::vector<std::string>& files)>;

/**
 * 绑定到一个 Session 的路径与元数据操作。
 * 所有路径先经过 path::normalize，原生错误码在这里映射为 Status。
 * 本身不持有状态，可以在多个线程上共享。
 */
class NamespaceService {
public:
    explicit NamespaceService(std::shared_ptr<Session> session);

    // 路径不存在时 out = false 且返回 OK，其他错误原样返回
    Status exists(const std::string& path, bool& out);
    // 不跟随符号链接，悬空链接也算存在
    Status lexists(const std::string& path, bool& out);
    Status is_dir(const std::string& path, bool& out);
    Status is_file(const std::string& path, bool& out);
    Status is_link(const std::string& path, bool& out);

    Status stat(const std::string& path, FileStat& st);
    Status lstat(const std::string& path, FileStat& st);
    Status get_size(const std::string& path, std::uint64_t& size);
    Status get_mtime(const std::string& path, std::uint64_t& mtime_ms);
    Status get_atime(const std::string& path, std::uint64_t& atime_ms);

    Status listdir(const std::string& path, std::vector<std::string>& names);
    Status scandir(const std::string& path, std::unique_ptr<DirReader>& out);

    Status mkdir(const std::string& path, std::uint32_t mode = kDefaultDirMode);
    Status makedirs(const std::string& path, std::uint32_t mode = kDefaultDirMode,
                    bool exist_ok = false);
    Status rmdir(const std::string& path);
    Status removedirs(const std::string& path);

    // 目录返回 kIsADirectory
    Status remove(const std::string& path);
    Status unlink(const std::string& path) { return remove(path); }
    // 是否跨目录原子取决于原生层，这里不额外保证
    Status rename(const std::string& src, const std::string& dst);
    // target 原样写入链接，不做规范化
    Status symlink(const std::string& target, const std::string& link_path);
    Status readlink(const std::string& path, std::string& target);

    // mode 为 F_OK 或 R_OK / W_OK / X_OK 的组合，按当前进程的 euid/egid 和权限位判断；
    // 路径不存在时 out = false 且返回 OK
    Status access(const std::string& path, int mode, bool& out);
    // 依次把 sources 的内容追加到 path 末尾；path 和所有 sources 必须已存在
    Status concat(const std::string& path, const std::vector<std::string>& sources);

    // 独占创建空文件，已存在时返回 kAlreadyExists
    Status create(const std::string& path, std::uint32_t mode = kDefaultFileMode);
    Status chmod(const std::string& path, std::uint32_t mode);
    Status chown(const std::string& path, std::uint32_t uid, std::uint32_t gid);
    Status truncate(const std::string& path, std::uint64_t length);
    Status utime(const std::string& path, std::uint64_t atime_ms,
                 std::uint64_t mtime_ms);
    // 两个时间都设为当前时间
    Status utime(const std::string& path);

    // 指向目录的符号链接列在 dirs 中，但不会进入
    Status walk(const std::string& top, bool topdown, const WalkVisitor& visitor);
    Status rmtree(const std::string& path);
    Status summary(const std::string& path, DirSummary& out);
    Status statvfs(StatVfs& out);

    // 属性不存在时 value = std::nullopt 且返回 OK
    Status getxattr(const std::string& path, const std::string& name,
                    std::optional<std::string>& value);
    Status setxattr(const std::string& path, const std::string& name,
                    const std::string& value, int flags = 0);
    Status removexattr(const std::string& path, const std::string& name);
    Status listxattr(const std::string& path, std::vector<std::string>& names);

    const std::shared_ptr<Session>& session() const { return session_; }

private:
    // check_active + normalize
    Status prepare(const std::string& in, std::string& out) const;
    Status probe(const std::string& path, bool follow, FileStat& st, bool& found);

    Status walk_normalized(const std::string& top, bool topdown,
                           const WalkVisitor& visitor);
    Status rmtree_normalized(const std::string& path);
    Status summary_normalized(const std::string& path, const FileStat& st,
                              DirSummary& out);

    INativeClient& native() const { return session_->native(); }
    MountHandle handle() const { return session_->handle(); }

    std::shared_ptr<Session> session_;
};

} // namespace dfsio
