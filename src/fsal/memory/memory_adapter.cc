#include "fsal/memory/memory_adapter.h"
#include "common/logging.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/xattr.h>

namespace dfsio {

namespace {

constexpr int kMaxSymlinkDepth = 40;

std::uint64_t now_ms() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) pos = path.size();
        if (pos > start) {
            parts.push_back(path.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return parts;
}

std::string join_parts(const std::vector<std::string>& parts, size_t begin,
                       size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        out += "/";
        out += parts[i];
    }
    return out.empty() ? "/" : out;
}

bool can_read(int flags) {
    return (flags & O_ACCMODE) != O_WRONLY;
}

bool can_write(int flags) {
    int acc = flags & O_ACCMODE;
    return acc == O_WRONLY || acc == O_RDWR;
}

} // namespace

MemoryFsAdapter::MemoryFsAdapter() = default;

MemoryFsAdapter::~MemoryFsAdapter() {
    std::lock_guard<std::mutex> g(mu_);
    if (!fds_.empty()) {
        log(LogLevel::WARN, "MemoryFsAdapter: %zu fd(s) still open at destruction",
            fds_.size());
    }
}

void MemoryFsAdapter::set_max_io_chunk(size_t n) {
    std::lock_guard<std::mutex> g(mu_);
    max_io_chunk_ = n;
}

void MemoryFsAdapter::set_write_budget(long long bytes) {
    std::lock_guard<std::mutex> g(mu_);
    write_budget_ = bytes;
}

void MemoryFsAdapter::set_listdir_page_size(size_t n) {
    std::lock_guard<std::mutex> g(mu_);
    listdir_page_size_ = n;
}

void MemoryFsAdapter::set_mount_error(int err) {
    std::lock_guard<std::mutex> g(mu_);
    mount_error_ = err;
}

size_t MemoryFsAdapter::open_fd_count() const {
    std::lock_guard<std::mutex> g(mu_);
    return fds_.size();
}

size_t MemoryFsAdapter::mount_count() const {
    std::lock_guard<std::mutex> g(mu_);
    return mounts_.size();
}

// ---------------------------------------------------------------------------
// 内部工具
// ---------------------------------------------------------------------------

int MemoryFsAdapter::mount_locked(MountHandle h, Mount*& m) {
    auto it = mounts_.find(h);
    if (it == mounts_.end()) {
        return -EBADF;
    }
    m = &it->second;
    return 0;
}

int MemoryFsAdapter::writable_mount_locked(MountHandle h, Mount*& m) {
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;
    return m->read_only ? -EROFS : 0;
}

int MemoryFsAdapter::file_locked(MountHandle h, int fd, OpenFile*& of) {
    auto it = fds_.find(fd);
    if (it == fds_.end() || it->second.h != h) {
        return -EBADF;
    }
    of = &it->second;
    return 0;
}

MemoryFsAdapter::NodePtr MemoryFsAdapter::new_node_locked(Volume& vol,
                                                          std::uint32_t mode) {
    auto n = std::make_shared<Node>();
    n->mode = mode;
    n->ino = vol.next_ino++;
    n->atime_ms = n->mtime_ms = n->ctime_ms = now_ms();
    return n;
}

int MemoryFsAdapter::resolve_locked(Volume& vol, const std::string& path,
                                    bool follow_last, NodePtr& out, int depth) {
    if (depth > kMaxSymlinkDepth) {
        return -ELOOP;
    }

    std::vector<std::string> parts = split_path(path);
    std::vector<NodePtr> stack {vol.root};
    std::vector<std::string> names;

    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& comp = parts[i];
        if (comp == ".") continue;
        if (comp == "..") {
            if (stack.size() > 1) {
                stack.pop_back();
                names.pop_back();
            }
            continue;
        }

        NodePtr cur = stack.back();
        if (!S_ISDIR(cur->mode)) {
            return -ENOTDIR;
        }
        auto it = cur->children.find(comp);
        if (it == cur->children.end()) {
            return -ENOENT;
        }

        NodePtr child = it->second;
        bool last = (i + 1 == parts.size());
        if (S_ISLNK(child->mode) && (!last || follow_last)) {
            // 把链接目标和剩余部分拼成新路径重新解析
            std::string next;
            if (!child->target.empty() && child->target[0] == '/') {
                next = child->target;
            } else {
                next = join_parts(names, 0, names.size()) + "/" + child->target;
            }
            if (!last) {
                next += join_parts(parts, i + 1, parts.size());
            }
            return resolve_locked(vol, next, follow_last, out, depth + 1);
        }

        stack.push_back(child);
        names.push_back(comp);
    }

    out = stack.back();
    return 0;
}

int MemoryFsAdapter::resolve_parent_locked(Volume& vol, const std::string& path,
                                           NodePtr& parent, std::string& leaf) {
    std::vector<std::string> parts = split_path(path);
    if (parts.empty()) {
        // 根目录没有父目录
        return -EBUSY;
    }
    leaf = parts.back();
    if (leaf == "." || leaf == "..") {
        return -EINVAL;
    }

    int rc = resolve_locked(vol, join_parts(parts, 0, parts.size() - 1), true, parent);
    if (rc < 0) return rc;
    if (!S_ISDIR(parent->mode)) {
        return -ENOTDIR;
    }
    return 0;
}

void MemoryFsAdapter::fill_stat(const Node& n, FileStat& st) {
    st.mode = n.mode;
    if (S_ISREG(n.mode)) {
        st.size = n.data.size();
    } else if (S_ISLNK(n.mode)) {
        st.size = n.target.size();
    } else {
        st.size = 0;
    }
    st.uid = n.uid;
    st.gid = n.gid;
    st.nlink = S_ISDIR(n.mode) ? 2 + n.children.size() : 1;
    st.ino = n.ino;
    st.atime_ms = n.atime_ms;
    st.mtime_ms = n.mtime_ms;
    st.ctime_ms = n.ctime_ms;
}

// ---------------------------------------------------------------------------
// 挂载
// ---------------------------------------------------------------------------

MountHandle MemoryFsAdapter::mount(const std::string& name, const MountConfig& cfg) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    if (mount_error_ != 0) {
        log(LogLevel::ERROR, "MemoryFsAdapter: mount %s failed (injected errno=%d)",
            name.c_str(), mount_error_);
        return -mount_error_;
    }

    auto& vol = volumes_[name];
    if (!vol) {
        vol = std::make_unique<Volume>();
        vol->root = std::make_shared<Node>();
        vol->root->mode = S_IFDIR | 0755;
        vol->root->ino = 1;
        vol->root->atime_ms = vol->root->mtime_ms = vol->root->ctime_ms = now_ms();
    }

    MountHandle h = next_handle_++;
    mounts_[h] = Mount{name, vol.get(), cfg.read_only()};
    log(LogLevel::DEBUG, "MemoryFsAdapter mounted name=%s handle=%ld read_only=%d",
        name.c_str(), static_cast<long>(h), static_cast<int>(cfg.read_only()));
    return h;
}

int MemoryFsAdapter::umount(MountHandle h) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    auto it = mounts_.find(h);
    if (it == mounts_.end()) {
        return -EBADF;
    }
    log(LogLevel::DEBUG, "MemoryFsAdapter unmounted name=%s", it->second.name.c_str());
    mounts_.erase(it);
    return 0;
}

// ---------------------------------------------------------------------------
// 文件描述符
// ---------------------------------------------------------------------------

int MemoryFsAdapter::open(MountHandle h, const std::string& path, int flags,
                          std::uint32_t mode) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    bool wants_write = can_write(flags) || (flags & (O_CREAT | O_TRUNC)) != 0;
    int rc = wants_write ? writable_mount_locked(h, m) : mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc == 0) {
        if (S_ISDIR(node->mode)) {
            return -EISDIR;
        }
        if ((flags & O_CREAT) && (flags & O_EXCL)) {
            return -EEXIST;
        }
        if ((flags & O_TRUNC) && can_write(flags)) {
            node->data.clear();
            node->mtime_ms = now_ms();
        }
    } else if (rc == -ENOENT && (flags & O_CREAT)) {
        NodePtr parent;
        std::string leaf;
        rc = resolve_parent_locked(*m->vol, path, parent, leaf);
        if (rc < 0) return rc;
        if (parent->children.count(leaf) != 0) {
            // 悬空的符号链接
            return -ENOENT;
        }
        node = new_node_locked(*m->vol, S_IFREG | (mode & 07777));
        parent->children[leaf] = node;
        parent->mtime_ms = now_ms();
    } else {
        return rc;
    }

    int fd = next_fd_++;
    fds_[fd] = OpenFile{h, node, flags, 0};
    return fd;
}

int MemoryFsAdapter::close(MountHandle h, int fd) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    fds_.erase(fd);
    return 0;
}

long MemoryFsAdapter::read(MountHandle h, int fd, char* buf, size_t len) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    if (!can_read(of->flags)) return -EBADF;

    const std::string& data = of->node->data;
    if (of->pos >= data.size()) {
        return 0;
    }
    size_t n = std::min<size_t>(len, data.size() - of->pos);
    if (max_io_chunk_ > 0) {
        n = std::min(n, max_io_chunk_);
    }
    std::memcpy(buf, data.data() + of->pos, n);
    of->pos += n;
    of->node->atime_ms = now_ms();
    return static_cast<long>(n);
}

long MemoryFsAdapter::pread(MountHandle h, int fd, char* buf, size_t len,
                            std::uint64_t offset) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    if (!can_read(of->flags)) return -EBADF;

    const std::string& data = of->node->data;
    if (offset >= data.size()) {
        return 0;
    }
    size_t n = std::min<size_t>(len, data.size() - offset);
    if (max_io_chunk_ > 0) {
        n = std::min(n, max_io_chunk_);
    }
    std::memcpy(buf, data.data() + offset, n);
    of->node->atime_ms = now_ms();
    return static_cast<long>(n);
}

long MemoryFsAdapter::write(MountHandle h, int fd, const char* buf, size_t len) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    if (!can_write(of->flags)) return -EBADF;

    std::string& data = of->node->data;
    if (of->flags & O_APPEND) {
        of->pos = data.size();
    }

    size_t n = len;
    if (max_io_chunk_ > 0) {
        n = std::min(n, max_io_chunk_);
    }
    if (write_budget_ >= 0) {
        n = std::min<size_t>(n, static_cast<size_t>(write_budget_));
        write_budget_ -= static_cast<long long>(n);
    }
    if (n == 0) {
        return 0;
    }

    if (of->pos + n > data.size()) {
        data.resize(of->pos + n, '\0');
    }
    std::memcpy(&data[of->pos], buf, n);
    of->pos += n;
    of->node->mtime_ms = now_ms();
    return static_cast<long>(n);
}

std::int64_t MemoryFsAdapter::lseek(MountHandle h, int fd, std::int64_t offset,
                                    int whence) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;

    std::int64_t base = 0;
    switch (whence) {
    case SEEK_SET: base = 0; break;
    case SEEK_CUR: base = static_cast<std::int64_t>(of->pos); break;
    case SEEK_END: base = static_cast<std::int64_t>(of->node->data.size()); break;
    default: return -EINVAL;
    }
    std::int64_t target = base + offset;
    if (target < 0) {
        return -EINVAL;
    }
    of->pos = static_cast<std::uint64_t>(target);
    return target;
}

int MemoryFsAdapter::fsync(MountHandle h, int fd, bool data_only) {
    (void)data_only;
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    return file_locked(h, fd, of);
}

int MemoryFsAdapter::ftruncate(MountHandle h, int fd, std::uint64_t length) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    if (!can_write(of->flags)) return -EBADF;

    of->node->data.resize(length, '\0');
    of->node->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::fstat(MountHandle h, int fd, FileStat& st) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    OpenFile* of = nullptr;
    int rc = file_locked(h, fd, of);
    if (rc < 0) return rc;
    fill_stat(*of->node, st);
    return 0;
}

// ---------------------------------------------------------------------------
// 元数据
// ---------------------------------------------------------------------------

int MemoryFsAdapter::stat(MountHandle h, const std::string& path, FileStat& st) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    fill_stat(*node, st);
    return 0;
}

int MemoryFsAdapter::lstat(MountHandle h, const std::string& path, FileStat& st) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, false, node);
    if (rc < 0) return rc;
    fill_stat(*node, st);
    return 0;
}

int MemoryFsAdapter::statvfs(MountHandle h, StatVfs& out) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    // 没有容量概念，给出一个固定的 1TiB 卷
    out.block_size = 4096;
    out.blocks = (1ULL << 40) / out.block_size;
    out.blocks_free = out.blocks;
    out.blocks_avail = out.blocks;
    out.files = m->vol->next_ino - 1;
    out.files_free = 0;
    out.name_max = 255;
    return 0;
}

int MemoryFsAdapter::mkdir(MountHandle h, const std::string& path, std::uint32_t mode) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr parent;
    std::string leaf;
    rc = resolve_parent_locked(*m->vol, path, parent, leaf);
    if (rc == -EBUSY) return -EEXIST; // mkdir("/")
    if (rc < 0) return rc;
    if (parent->children.count(leaf) != 0) {
        return -EEXIST;
    }
    parent->children[leaf] = new_node_locked(*m->vol, S_IFDIR | (mode & 07777));
    parent->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::rmdir(MountHandle h, const std::string& path) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr parent;
    std::string leaf;
    rc = resolve_parent_locked(*m->vol, path, parent, leaf);
    if (rc < 0) return rc;
    auto it = parent->children.find(leaf);
    if (it == parent->children.end()) {
        return -ENOENT;
    }
    if (!S_ISDIR(it->second->mode)) {
        return -ENOTDIR;
    }
    if (!it->second->children.empty()) {
        return -ENOTEMPTY;
    }
    parent->children.erase(it);
    parent->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::unlink(MountHandle h, const std::string& path) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr parent;
    std::string leaf;
    rc = resolve_parent_locked(*m->vol, path, parent, leaf);
    if (rc == -EBUSY) return -EISDIR;
    if (rc < 0) return rc;
    auto it = parent->children.find(leaf);
    if (it == parent->children.end()) {
        return -ENOENT;
    }
    if (S_ISDIR(it->second->mode)) {
        return -EISDIR;
    }
    // 已打开的 fd 通过 shared_ptr 继续持有数据
    parent->children.erase(it);
    parent->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::rename(MountHandle h, const std::string& src,
                            const std::string& dst) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr src_parent, dst_parent;
    std::string src_leaf, dst_leaf;
    rc = resolve_parent_locked(*m->vol, src, src_parent, src_leaf);
    if (rc < 0) return rc;
    rc = resolve_parent_locked(*m->vol, dst, dst_parent, dst_leaf);
    if (rc < 0) return rc;

    auto sit = src_parent->children.find(src_leaf);
    if (sit == src_parent->children.end()) {
        return -ENOENT;
    }
    NodePtr node = sit->second;

    // 不能把目录移动到它自己的子树下
    if (S_ISDIR(node->mode)) {
        NodePtr probe;
        std::vector<std::string> parts = split_path(dst);
        for (size_t i = 1; i < parts.size(); ++i) {
            if (resolve_locked(*m->vol, join_parts(parts, 0, i), true, probe) == 0 &&
                probe == node) {
                return -EINVAL;
            }
        }
    }

    auto dit = dst_parent->children.find(dst_leaf);
    if (dit != dst_parent->children.end()) {
        if (dit->second == node) {
            return 0;
        }
        bool src_dir = S_ISDIR(node->mode);
        bool dst_dir = S_ISDIR(dit->second->mode);
        if (src_dir && !dst_dir) return -ENOTDIR;
        if (!src_dir && dst_dir) return -EISDIR;
        if (dst_dir && !dit->second->children.empty()) return -ENOTEMPTY;
    }

    src_parent->children.erase(src_leaf);
    dst_parent->children[dst_leaf] = node;
    std::uint64_t now = now_ms();
    src_parent->mtime_ms = now;
    dst_parent->mtime_ms = now;
    node->ctime_ms = now;
    return 0;
}

int MemoryFsAdapter::symlink(MountHandle h, const std::string& target,
                             const std::string& link_path) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr parent;
    std::string leaf;
    rc = resolve_parent_locked(*m->vol, link_path, parent, leaf);
    if (rc == -EBUSY) return -EEXIST;
    if (rc < 0) return rc;
    if (parent->children.count(leaf) != 0) {
        return -EEXIST;
    }
    NodePtr link = new_node_locked(*m->vol, S_IFLNK | 0777);
    link->target = target;
    parent->children[leaf] = link;
    parent->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::readlink(MountHandle h, const std::string& path,
                              std::string& target) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, false, node);
    if (rc < 0) return rc;
    if (!S_ISLNK(node->mode)) {
        return -EINVAL;
    }
    target = node->target;
    return 0;
}

int MemoryFsAdapter::chmod(MountHandle h, const std::string& path, std::uint32_t mode) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    node->mode = (node->mode & ~07777u) | (mode & 07777u);
    node->ctime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::chown(MountHandle h, const std::string& path,
                           std::uint32_t uid, std::uint32_t gid) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    node->uid = uid;
    node->gid = gid;
    node->ctime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::truncate(MountHandle h, const std::string& path,
                              std::uint64_t length) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    if (S_ISDIR(node->mode)) {
        return -EISDIR;
    }
    node->data.resize(length, '\0');
    node->mtime_ms = now_ms();
    return 0;
}

int MemoryFsAdapter::utime(MountHandle h, const std::string& path,
                           std::uint64_t atime_ms, std::uint64_t mtime_ms) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    node->atime_ms = atime_ms;
    node->mtime_ms = mtime_ms;
    return 0;
}

int MemoryFsAdapter::listdir(MountHandle h, const std::string& path,
                             std::uint64_t cookie, size_t max_entries,
                             std::vector<DirEntry>& out,
                             std::uint64_t& next_cookie) {
    ++calls_;
    ++listdir_calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr dir;
    rc = resolve_locked(*m->vol, path, true, dir);
    if (rc < 0) return rc;
    if (!S_ISDIR(dir->mode)) {
        return -ENOTDIR;
    }

    size_t limit = max_entries;
    if (listdir_page_size_ > 0 && (limit == 0 || listdir_page_size_ < limit)) {
        limit = listdir_page_size_;
    }

    // cookie 即已返回的条目数
    out.clear();
    next_cookie = 0;
    auto it = dir->children.begin();
    std::advance(it, std::min<std::uint64_t>(cookie, dir->children.size()));
    for (; it != dir->children.end(); ++it) {
        if (limit > 0 && out.size() >= limit) {
            next_cookie = cookie + out.size();
            break;
        }
        DirEntry e;
        e.name = it->first;
        fill_stat(*it->second, e.stat);
        e.kind = e.stat.kind();
        out.push_back(std::move(e));
    }
    return static_cast<int>(out.size());
}

// ---------------------------------------------------------------------------
// 扩展属性
// ---------------------------------------------------------------------------

int MemoryFsAdapter::getxattr(MountHandle h, const std::string& path,
                              const std::string& name, std::string& value) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    auto it = node->xattrs.find(name);
    if (it == node->xattrs.end()) {
        return -ENODATA;
    }
    value = it->second;
    return 0;
}

int MemoryFsAdapter::setxattr(MountHandle h, const std::string& path,
                              const std::string& name, const std::string& value,
                              int flags) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;

    bool exists = node->xattrs.count(name) != 0;
    if ((flags & XATTR_CREATE) && exists) return -EEXIST;
    if ((flags & XATTR_REPLACE) && !exists) return -ENODATA;
    node->xattrs[name] = value;
    return 0;
}

int MemoryFsAdapter::removexattr(MountHandle h, const std::string& path,
                                 const std::string& name) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = writable_mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    if (node->xattrs.erase(name) == 0) {
        return -ENODATA;
    }
    return 0;
}

int MemoryFsAdapter::listxattr(MountHandle h, const std::string& path,
                               std::vector<std::string>& names) {
    ++calls_;
    std::lock_guard<std::mutex> g(mu_);
    Mount* m = nullptr;
    int rc = mount_locked(h, m);
    if (rc < 0) return rc;

    NodePtr node;
    rc = resolve_locked(*m->vol, path, true, node);
    if (rc < 0) return rc;
    names.clear();
    for (const auto& [k, v] : node->xattrs) {
        (void)v;
        names.push_back(k);
    }
    return 0;
}

} // namespace dfsio
