#include "core/io/file_handle.h"
#include "core/namespace/path_util.h"
#include "common/logging.h"

#include <cerrno>

namespace dfsio {

Status FileHandle::open(std::shared_ptr<Session> session,
                        const std::string& path,
                        const OpenMode& mode,
                        std::uint32_t perm,
                        std::unique_ptr<FileHandle>& out) {
    if (!session) {
        return Status::InvalidArgument("null session");
    }
    std::string p;
    Status st = path::normalize(path, p);
    if (!st.ok()) return st;

    // 先占用计数，close_session 不会在原生 open 进行中卸载
    st = session->acquire_handle();
    if (!st.ok()) return st;

    int fd = session->native().open(session->handle(), p, mode.native_flags(), perm);
    if (fd < 0) {
        session->release_handle();
        return status_from_native(fd, "open " + p);
    }

    out.reset(new FileHandle(std::move(session), std::move(p), mode, fd));
    log(LogLevel::DEBUG, "FileHandle open path=%s mode=%s fd=%d",
        out->path_.c_str(), mode.to_string().c_str(), fd);
    return Status::OK();
}

FileHandle::FileHandle(std::shared_ptr<Session> session, std::string path,
                       OpenMode mode, int fd)
    : session_(std::move(session)),
      path_(std::move(path)),
      mode_(mode),
      fd_(fd),
      open_(true) {}

FileHandle::~FileHandle() {
    if (open_) {
        Status st = close();
        if (!st.ok()) {
            log(LogLevel::ERROR, "FileHandle close on destruction failed path=%s: %s",
                path_.c_str(), st.to_string().c_str());
        }
    }
}

Status FileHandle::check_open() const {
    if (!open_) {
        return Status::StreamClosed("file handle closed: " + path_);
    }
    return Status::OK();
}

Status FileHandle::close() {
    if (!open_) {
        return Status::OK();
    }

    // 无论原生 close 成功与否，这个 fd 都不再使用
    open_ = false;
    int rc = session_->native().close(session_->handle(), fd_);
    session_->release_handle();
    log(LogLevel::DEBUG, "FileHandle close path=%s fd=%d rc=%d", path_.c_str(), fd_, rc);
    fd_ = -1;
    return status_from_native(rc, "close " + path_);
}

Status FileHandle::read_raw(char* buf, size_t len, size_t& out_n) {
    out_n = 0;
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.readable()) {
        return Status::UnsupportedOperation("file not open for reading: " + path_);
    }
    if (len == 0) return Status::OK();

    long rc = session_->native().read(session_->handle(), fd_, buf, len);
    if (rc < 0) {
        return status_from_native(rc, "read " + path_);
    }
    out_n = static_cast<size_t>(rc);
    return Status::OK();
}

Status FileHandle::pread_raw(char* buf, size_t len, std::uint64_t offset,
                             size_t& out_n) {
    out_n = 0;
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.readable()) {
        return Status::UnsupportedOperation("file not open for reading: " + path_);
    }
    if (len == 0) return Status::OK();

    long rc = session_->native().pread(session_->handle(), fd_, buf, len, offset);
    if (rc < 0) {
        return status_from_native(rc, "pread " + path_);
    }
    out_n = static_cast<size_t>(rc);
    return Status::OK();
}

Status FileHandle::write_raw(const char* data, size_t len, size_t& out_written) {
    out_written = 0;
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.writable()) {
        return Status::UnsupportedOperation("file not open for writing: " + path_);
    }

    size_t total = 0;
    while (total < len) {
        long rc = session_->native().write(session_->handle(), fd_,
                                           data + total, len - total);
        if (rc < 0) {
            out_written = total;
            return status_from_native(rc, "write " + path_);
        }
        if (rc == 0) {
            break;
        }
        total += static_cast<size_t>(rc);
    }

    out_written = total;
    if (total < len) {
        log(LogLevel::ERROR, "short write path=%s accepted=%zu requested=%zu",
            path_.c_str(), total, len);
        return Status::ShortWrite("short write on " + path_ + ": " +
                                  std::to_string(total) + " of " +
                                  std::to_string(len) + " bytes accepted");
    }
    return Status::OK();
}

Status FileHandle::seek_raw(std::int64_t offset, Whence whence,
                            std::uint64_t& out_pos) {
    Status st = check_open();
    if (!st.ok()) return st;
    if (whence == Whence::kFromStart && offset < 0) {
        return Status::InvalidSeek("negative seek position " + std::to_string(offset));
    }

    std::int64_t rc = session_->native().lseek(session_->handle(), fd_, offset,
                                               to_native_whence(whence));
    if (rc == -EINVAL) {
        return Status::InvalidSeek("invalid seek on " + path_ + " offset=" +
                                   std::to_string(offset));
    }
    if (rc < 0) {
        return status_from_native(static_cast<long>(rc), "lseek " + path_);
    }
    out_pos = static_cast<std::uint64_t>(rc);
    return Status::OK();
}

Status FileHandle::flush() {
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.writable()) return Status::OK();

    int rc = session_->native().fsync(session_->handle(), fd_, true);
    return status_from_native(rc, "fsync " + path_);
}

Status FileHandle::truncate(std::uint64_t length) {
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.writable()) {
        return Status::UnsupportedOperation("file not open for writing: " + path_);
    }

    int rc = session_->native().ftruncate(session_->handle(), fd_, length);
    return status_from_native(rc, "ftruncate " + path_);
}

Status FileHandle::stat(FileStat& st_out) {
    Status st = check_open();
    if (!st.ok()) return st;

    int rc = session_->native().fstat(session_->handle(), fd_, st_out);
    return status_from_native(rc, "fstat " + path_);
}

} // namespace dfsio
