#include "core/namespace/namespace_service.h"
#include "core/namespace/path_util.h"
#include "core/io/file_handle.h"
#include "common/logging.h"

#include <cerrno>
#include <chrono>
#include <unistd.h>

namespace dfsio {

namespace {

constexpr size_t kConcatChunkSize = 1 << 20;

} // namespace

NamespaceService::NamespaceService(std::shared_ptr<Session> session)
    : session_(std::move(session)) {}

Status NamespaceService::prepare(const std::string& in, std::string& out) const {
    if (!session_) {
        return Status::InvalidArgument("null session");
    }
    Status st = session_->check_active();
    if (!st.ok()) return st;
    return path::normalize(in, out);
}

Status NamespaceService::probe(const std::string& path, bool follow,
                               FileStat& st, bool& found) {
    found = false;
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    int rc = follow ? native().stat(handle(), p, st)
                    : native().lstat(handle(), p, st);
    // 中间某一级不是目录时，路径同样不存在
    if (rc == -ENOENT || rc == -ENOTDIR) {
        return Status::OK();
    }
    if (rc < 0) {
        return status_from_native(rc, (follow ? "stat " : "lstat ") + p);
    }
    found = true;
    return Status::OK();
}

// ---------------------------------------------------------------------------
// 查询
// ---------------------------------------------------------------------------

Status NamespaceService::exists(const std::string& path, bool& out) {
    FileStat st;
    return probe(path, true, st, out);
}

Status NamespaceService::lexists(const std::string& path, bool& out) {
    FileStat st;
    return probe(path, false, st, out);
}

Status NamespaceService::is_dir(const std::string& path, bool& out) {
    FileStat st;
    bool found = false;
    Status s = probe(path, true, st, found);
    out = found && st.is_dir();
    return s;
}

Status NamespaceService::is_file(const std::string& path, bool& out) {
    FileStat st;
    bool found = false;
    Status s = probe(path, true, st, found);
    out = found && st.is_file();
    return s;
}

Status NamespaceService::is_link(const std::string& path, bool& out) {
    FileStat st;
    bool found = false;
    Status s = probe(path, false, st, found);
    out = found && st.is_symlink();
    return s;
}

Status NamespaceService::stat(const std::string& path, FileStat& st) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().stat(handle(), p, st), "stat " + p);
}

Status NamespaceService::lstat(const std::string& path, FileStat& st) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().lstat(handle(), p, st), "lstat " + p);
}

Status NamespaceService::get_size(const std::string& path, std::uint64_t& size) {
    FileStat st;
    Status s = stat(path, st);
    if (s.ok()) size = st.size;
    return s;
}

Status NamespaceService::get_mtime(const std::string& path, std::uint64_t& mtime_ms) {
    FileStat st;
    Status s = stat(path, st);
    if (s.ok()) mtime_ms = st.mtime_ms;
    return s;
}

Status NamespaceService::get_atime(const std::string& path, std::uint64_t& atime_ms) {
    FileStat st;
    Status s = stat(path, st);
    if (s.ok()) atime_ms = st.atime_ms;
    return s;
}

// ---------------------------------------------------------------------------
// 目录
// ---------------------------------------------------------------------------

Status NamespaceService::scandir(const std::string& path,
                                 std::unique_ptr<DirReader>& out) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    out.reset(new DirReader(session_, p));
    return Status::OK();
}

Status NamespaceService::listdir(const std::string& path,
                                 std::vector<std::string>& names) {
    names.clear();
    std::unique_ptr<DirReader> reader;
    Status s = scandir(path, reader);
    if (!s.ok()) return s;

    for (;;) {
        DirEntry e;
        bool done = false;
        s = reader->next(e, done);
        if (!s.ok()) return s;
        if (done) break;
        names.push_back(std::move(e.name));
    }
    return Status::OK();
}

Status NamespaceService::mkdir(const std::string& path, std::uint32_t mode) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().mkdir(handle(), p, mode), "mkdir " + p);
}

Status NamespaceService::makedirs(const std::string& path, std::uint32_t mode,
                                  bool exist_ok) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    int rc = path::is_root(p) ? -EEXIST : native().mkdir(handle(), p, mode);
    if (rc == -ENOENT) {
        // 父目录不存在，先递归创建父目录（父目录已存在不算错误）
        s = makedirs(path::dirname(p), mode, true);
        if (!s.ok()) return s;
        rc = native().mkdir(handle(), p, mode);
    }
    if (rc == -EEXIST && exist_ok) {
        FileStat st;
        int src = native().stat(handle(), p, st);
        if (src == 0 && st.is_dir()) {
            return Status::OK();
        }
    }
    if (rc == -EEXIST) {
        return Status::Error(StatusCode::kAlreadyExists,
                             "makedirs " + p + ": File exists", EEXIST);
    }
    return status_from_native(rc, "makedirs " + p);
}

Status NamespaceService::rmdir(const std::string& path) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().rmdir(handle(), p), "rmdir " + p);
}

Status NamespaceService::removedirs(const std::string& path) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    s = rmdir(p);
    if (!s.ok()) return s;

    // 逐级删除空的父目录，遇到第一个失败就停止
    std::string head = path::dirname(p);
    while (!path::is_root(head)) {
        int rc = native().rmdir(handle(), head);
        if (rc < 0) {
            log(LogLevel::DEBUG, "removedirs stopped at %s rc=%d", head.c_str(), rc);
            break;
        }
        head = path::dirname(head);
    }
    return Status::OK();
}

// ---------------------------------------------------------------------------
// 文件与链接
// ---------------------------------------------------------------------------

Status NamespaceService::remove(const std::string& path) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().unlink(handle(), p), "unlink " + p);
}

Status NamespaceService::rename(const std::string& src, const std::string& dst) {
    std::string s_path;
    std::string d_path;
    Status s = prepare(src, s_path);
    if (!s.ok()) return s;
    s = path::normalize(dst, d_path);
    if (!s.ok()) return s;
    return status_from_native(native().rename(handle(), s_path, d_path),
                              "rename " + s_path + " -> " + d_path);
}

Status NamespaceService::symlink(const std::string& target,
                                 const std::string& link_path) {
    if (target.empty()) {
        return Status::InvalidArgument("empty symlink target");
    }
    std::string p;
    Status s = prepare(link_path, p);
    if (!s.ok()) return s;
    return status_from_native(native().symlink(handle(), target, p),
                              "symlink " + p + " -> " + target);
}

Status NamespaceService::readlink(const std::string& path, std::string& target) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().readlink(handle(), p, target), "readlink " + p);
}

Status NamespaceService::create(const std::string& path, std::uint32_t mode) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    std::unique_ptr<FileHandle> fh;
    s = FileHandle::open(session_, p, OpenMode{AccessMode::kExclusive, true}, mode, fh);
    if (!s.ok()) return s;
    return fh->close();
}

Status NamespaceService::access(const std::string& path, int mode, bool& out) {
    out = false;
    if (mode & ~(R_OK | W_OK | X_OK)) {
        return Status::InvalidArgument("invalid access mode " + std::to_string(mode));
    }

    FileStat st;
    bool found = false;
    Status s = probe(path, true, st, found);
    if (!s.ok() || !found) return s;

    if ((mode & W_OK) && session_->read_only()) {
        return Status::OK();
    }

    std::uint32_t want = ((mode & R_OK) ? 4u : 0u) | ((mode & W_OK) ? 2u : 0u) |
                         ((mode & X_OK) ? 1u : 0u);
    std::uint32_t perm = st.permissions();
    uid_t uid = geteuid();
    if (uid == 0) {
        // root 读写不受权限位限制，执行至少要有一个 x 位
        out = !(want & 1u) || st.is_dir() || (perm & 0111) != 0;
        return Status::OK();
    }

    unsigned shift = 0;
    if (st.uid == uid) {
        shift = 6;
    } else if (st.gid == getegid()) {
        shift = 3;
    }
    out = (((perm >> shift) & 7u) & want) == want;
    return Status::OK();
}

Status NamespaceService::concat(const std::string& path,
                                const std::vector<std::string>& sources) {
    std::string dst;
    Status s = prepare(path, dst);
    if (!s.ok()) return s;

    // 先确认所有源文件存在，避免只追加了一部分
    std::vector<std::string> srcs;
    srcs.reserve(sources.size());
    for (const auto& src : sources) {
        std::string sp;
        s = path::normalize(src, sp);
        if (!s.ok()) return s;
        if (sp == dst) {
            return Status::InvalidArgument("concat source is the target: " + sp);
        }
        FileStat st;
        int rc = native().stat(handle(), sp, st);
        if (rc < 0) {
            return status_from_native(rc, "concat source " + sp);
        }
        if (st.is_dir()) {
            return status_from_native(-EISDIR, "concat source " + sp);
        }
        srcs.push_back(std::move(sp));
    }

    FileStat dst_st;
    int rc = native().stat(handle(), dst, dst_st);
    if (rc < 0) {
        return status_from_native(rc, "concat target " + dst);
    }

    std::unique_ptr<FileHandle> out;
    s = FileHandle::open(session_, dst, OpenMode::AppendBinary(), kDefaultFileMode, out);
    if (!s.ok()) return s;

    std::vector<char> buf(kConcatChunkSize);
    for (const auto& sp : srcs) {
        std::unique_ptr<FileHandle> in;
        s = FileHandle::open(session_, sp, OpenMode::ReadBinary(), kDefaultFileMode, in);
        if (!s.ok()) return s;

        for (;;) {
            size_t n = 0;
            s = in->read_raw(buf.data(), buf.size(), n);
            if (!s.ok()) return s;
            if (n == 0) break;
            size_t written = 0;
            s = out->write_raw(buf.data(), n, written);
            if (!s.ok()) return s;
        }
        s = in->close();
        if (!s.ok()) return s;
    }

    log(LogLevel::DEBUG, "concat %s <- %zu file(s)", dst.c_str(), srcs.size());
    return out->close();
}

Status NamespaceService::chmod(const std::string& path, std::uint32_t mode) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().chmod(handle(), p, mode), "chmod " + p);
}

Status NamespaceService::chown(const std::string& path, std::uint32_t uid,
                               std::uint32_t gid) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().chown(handle(), p, uid, gid), "chown " + p);
}

Status NamespaceService::truncate(const std::string& path, std::uint64_t length) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().truncate(handle(), p, length), "truncate " + p);
}

Status NamespaceService::utime(const std::string& path, std::uint64_t atime_ms,
                               std::uint64_t mtime_ms) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().utime(handle(), p, atime_ms, mtime_ms),
                              "utime " + p);
}

Status NamespaceService::utime(const std::string& path) {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count();
    return utime(path, static_cast<std::uint64_t>(now), static_cast<std::uint64_t>(now));
}

// ---------------------------------------------------------------------------
// 递归操作
// ---------------------------------------------------------------------------

Status NamespaceService::walk(const std::string& top, bool topdown,
                              const WalkVisitor& visitor) {
    std::string p;
    Status s = prepare(top, p);
    if (!s.ok()) return s;
    return walk_normalized(p, topdown, visitor);
}

Status NamespaceService::walk_normalized(const std::string& top, bool topdown,
                                         const WalkVisitor& visitor) {
    std::vector<std::string> dirs;
    std::vector<std::string> files;
    std::vector<std::string> linked_dirs;

    DirReader reader(session_, top);
    for (;;) {
        DirEntry e;
        bool done = false;
        Status s = reader.next(e, done);
        if (!s.ok()) return s;
        if (done) break;

        if (e.kind == FileKind::kDirectory) {
            dirs.push_back(e.name);
        } else if (e.kind == FileKind::kSymlink) {
            FileStat target;
            int rc = native().stat(handle(), path::join(top, e.name), target);
            if (rc == 0 && target.is_dir()) {
                dirs.push_back(e.name);
                linked_dirs.push_back(e.name);
            } else {
                files.push_back(e.name);
            }
        } else {
            files.push_back(e.name);
        }
    }

    auto is_linked = [&linked_dirs](const std::string& name) {
        for (const auto& l : linked_dirs) {
            if (l == name) return true;
        }
        return false;
    };

    if (topdown) {
        Status s = visitor(top, dirs, files);
        if (!s.ok()) return s;
    }

    // 自顶向下时 dirs 可能已被回调修改，按修改后的列表递归
    std::vector<std::string> subdirs = dirs;
    for (const auto& d : subdirs) {
        if (is_linked(d)) continue;
        Status s = walk_normalized(path::join(top, d), topdown, visitor);
        if (!s.ok()) return s;
    }

    if (!topdown) {
        return visitor(top, dirs, files);
    }
    return Status::OK();
}

Status NamespaceService::rmtree(const std::string& path) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    if (path::is_root(p)) {
        return Status::InvalidArgument("refusing to remove the mount root");
    }
    return rmtree_normalized(p);
}

Status NamespaceService::rmtree_normalized(const std::string& p) {
    FileStat st;
    int rc = native().lstat(handle(), p, st);
    if (rc < 0) {
        return status_from_native(rc, "lstat " + p);
    }
    if (!st.is_dir()) {
        return status_from_native(native().unlink(handle(), p), "unlink " + p);
    }

    // 先把整个目录读完再删除，避免边删边翻页导致 cookie 失效
    std::vector<DirEntry> entries;
    DirReader reader(session_, p);
    for (;;) {
        DirEntry e;
        bool done = false;
        Status s = reader.next(e, done);
        if (!s.ok()) return s;
        if (done) break;
        entries.push_back(std::move(e));
    }

    for (const auto& e : entries) {
        std::string child = path::join(p, e.name);
        Status s = e.kind == FileKind::kDirectory
                       ? rmtree_normalized(child)
                       : status_from_native(native().unlink(handle(), child),
                                            "unlink " + child);
        if (!s.ok()) return s;
    }
    return status_from_native(native().rmdir(handle(), p), "rmdir " + p);
}

Status NamespaceService::summary(const std::string& path, DirSummary& out) {
    out = DirSummary{};
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    FileStat st;
    int rc = native().lstat(handle(), p, st);
    if (rc < 0) {
        return status_from_native(rc, "lstat " + p);
    }
    return summary_normalized(p, st, out);
}

Status NamespaceService::summary_normalized(const std::string& p,
                                            const FileStat& st,
                                            DirSummary& out) {
    if (!st.is_dir()) {
        out.size += st.size;
        ++out.files;
        return Status::OK();
    }

    ++out.dirs;
    DirReader reader(session_, p);
    for (;;) {
        DirEntry e;
        bool done = false;
        Status s = reader.next(e, done);
        if (!s.ok()) return s;
        if (done) break;
        s = summary_normalized(path::join(p, e.name), e.stat, out);
        if (!s.ok()) return s;
    }
    return Status::OK();
}

Status NamespaceService::statvfs(StatVfs& out) {
    if (!session_) {
        return Status::InvalidArgument("null session");
    }
    Status s = session_->check_active();
    if (!s.ok()) return s;
    return status_from_native(native().statvfs(handle(), out), "statvfs");
}

// ---------------------------------------------------------------------------
// 扩展属性
// ---------------------------------------------------------------------------

Status NamespaceService::getxattr(const std::string& path, const std::string& name,
                                  std::optional<std::string>& value) {
    value.reset();
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;

    std::string v;
    int rc = native().getxattr(handle(), p, name, v);
    if (rc == -ENODATA) {
        return Status::OK();
    }
    if (rc < 0) {
        return status_from_native(rc, "getxattr " + p + " " + name);
    }
    value = std::move(v);
    return Status::OK();
}

Status NamespaceService::setxattr(const std::string& path, const std::string& name,
                                  const std::string& value, int flags) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().setxattr(handle(), p, name, value, flags),
                              "setxattr " + p + " " + name);
}

Status NamespaceService::removexattr(const std::string& path, const std::string& name) {
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().removexattr(handle(), p, name),
                              "removexattr " + p + " " + name);
}

Status NamespaceService::listxattr(const std::string& path,
                                   std::vector<std::string>& names) {
    names.clear();
    std::string p;
    Status s = prepare(path, p);
    if (!s.ok()) return s;
    return status_from_native(native().listxattr(handle(), p, names), "listxattr " + p);
}

} // namespace dfsio
