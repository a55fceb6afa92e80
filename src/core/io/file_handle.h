#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "common/status.h"
#include "common/types.h"
#include "core/io/open_mode.h"
#include "core/session/session.h"

namespace dfsio {

/**
 * 独占一个原生 fd。
 *
 * - 不可复制；析构时如果还没关闭会自动 close；
 * - close 幂等，原生 close 只调用一次；
 * - 同一个 FileHandle 不做内部加锁，多线程使用需要调用方串行化。
 */
class FileHandle {
public:
    // 模式不支持时在调用原生 open 之前就返回
    static Status open(std::shared_ptr<Session> session,
                       const std::string& path,
                       const OpenMode& mode,
                       std::uint32_t perm,
                       std::unique_ptr<FileHandle>& out);

    ~FileHandle();

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    Status close();
    bool is_open() const { return open_; }

    // 单次原生 read，out_n 可能小于 len，0 表示 EOF
    Status read_raw(char* buf, size_t len, size_t& out_n);
    // 单次原生 pread，不移动文件位置
    Status pread_raw(char* buf, size_t len, std::uint64_t offset, size_t& out_n);
    // 反复调用原生 write 直到写完；某次返回 0 时以 kShortWrite 失败
    Status write_raw(const char* data, size_t len, size_t& out_written);
    Status seek_raw(std::int64_t offset, Whence whence, std::uint64_t& out_pos);

    Status flush();
    Status truncate(std::uint64_t length);
    Status stat(FileStat& st);

    const std::string& path() const { return path_; }
    const OpenMode& mode() const { return mode_; }
    int fd() const { return fd_; }
    const std::shared_ptr<Session>& session() const { return session_; }

private:
    FileHandle(std::shared_ptr<Session> session, std::string path,
               OpenMode mode, int fd);

    Status check_open() const;

    std::shared_ptr<Session> session_;
    std::string path_;
    OpenMode mode_;
    int fd_ {-1};
    bool open_ {false};
};

} // namespace dfsio
