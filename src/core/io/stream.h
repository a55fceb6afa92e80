#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "common/status.h"
#include "common/types.h"
#include "core/io/file_handle.h"
#include "core/io/open_mode.h"
#include "core/io/text_codec.h"
#include "core/session/session.h"

namespace dfsio {

inline constexpr size_t kDefaultBufferSize = 64 * 1024;

struct OpenOptions {
    // 只允许文本模式设置，空串表示 utf-8
    std::string encoding;
    // 新建文件的权限位
    std::uint32_t perm {kDefaultFileMode};
    // 读缓冲大小，0 表示使用默认值
    size_t buffer_size {kDefaultBufferSize};
};

class Stream;

/**
 * 打开文件，返回 Stream。
 *
 * mode: "rb" "wb" "ab" "xb" 以及对应的文本模式 "r" "w" "a" "x"（可带 't'）。
 * 带 "+" 的模式返回 kUnsupportedMode，不会发起任何原生调用。
 */
Status open(std::shared_ptr<Session> session,
            const std::string& path,
            const std::string& mode,
            std::unique_ptr<Stream>& out,
            const OpenOptions& opts = OpenOptions());

/**
 * Stream::lines() 返回的单遍输入区间。
 * 读到文件末尾或出错时结束，出错原因通过 status() 取得。
 */
class LineRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(LineRange* r) : range_(r) {}

        reference operator*() const { return range_->current_; }
        pointer operator->() const { return &range_->current_; }
        iterator& operator++() {
            range_->advance();
            return *this;
        }
        bool operator==(const iterator& o) const { return at_end() == o.at_end(); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        bool at_end() const { return range_ == nullptr || range_->done_; }
        LineRange* range_ {nullptr};
    };

    explicit LineRange(Stream* s) : stream_(s) {}

    iterator begin();
    iterator end() { return iterator(); }

    const Status& status() const { return status_; }

private:
    void advance();

    Stream* stream_;
    Status status_ {Status::OK()};
    std::string current_;
    bool started_ {false};
    bool done_ {false};
};

/**
 * open() 返回的文件对象。
 *
 * 状态只有 Open 和 Closed；关闭之后除再次 close 以外的操作都返回 kStreamClosed。
 * tell() 读的是本地位置账本，不调用原生 lseek。
 *
 * 读：二进制和文本模式共用一个预读缓冲，任何 seek 都会丢弃它；
 *     文本模式下残留的半个 UTF-8 序列也在 seek 时丢弃。
 * 写：不做缓冲，每次 write 都直接落到 FileHandle。
 *
 * 和 FileHandle 一样不做内部加锁，同一个 Stream 不要在多个线程上并发使用。
 */
class Stream {
public:
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    // n < 0 读到文件末尾；二进制模式 n 是字节数，文本模式 n 是字符数
    Status read(std::int64_t n, std::string& out);
    Status read_all(std::string& out) { return read(-1, out); }

    Status write(const std::string& data);
    Status write(const char* data, size_t len);

    // 仅二进制模式：从 offset 读最多 size 字节，不影响 tell() 和预读缓冲
    Status pread(size_t size, std::uint64_t offset, std::string& out);

    Status seek(std::int64_t offset, Whence whence, std::uint64_t& out_pos);
    Status seek(std::int64_t offset, Whence whence = Whence::kFromStart);
    Status tell(std::uint64_t& out_pos) const;

    // 包含结尾的 '\n'；返回空串表示已到文件末尾
    Status readline(std::string& line);
    LineRange lines() { return LineRange(this); }

    // 截断到 size，不移动当前位置；不带参数时截断到 tell()
    Status truncate();
    Status truncate(std::uint64_t size);
    Status flush();
    Status stat(FileStat& st);

    Status close();
    bool closed() const { return closed_; }

    bool readable() const { return mode_.readable(); }
    bool writable() const { return mode_.writable(); }
    bool binary() const { return mode_.binary; }
    std::string mode() const { return mode_.to_string(); }
    const std::string& name() const { return name_; }
    Encoding encoding() const { return decoder_.encoding(); }

private:
    friend Status open(std::shared_ptr<Session> session,
                       const std::string& path,
                       const std::string& mode,
                       std::unique_ptr<Stream>& out,
                       const OpenOptions& opts);

    Stream(std::unique_ptr<FileHandle> handle, OpenMode mode,
           Encoding enc, size_t buffer_size, std::uint64_t pos);

    Status check_open() const;
    Status check_readable() const;
    size_t buffered() const { return rbuf_len_ - rbuf_off_; }
    // 缓冲区读空之后调用，eof 表示原生 read 返回 0
    Status fill_buffer(bool& eof);
    void discard_buffer();

    Status read_binary(std::int64_t n, std::string& out);
    Status read_text(std::int64_t n, std::string& out);

    std::unique_ptr<FileHandle> handle_;
    OpenMode mode_;
    std::string name_;
    TextDecoder decoder_;

    // 下一个尚未交给调用方的字节在文件中的位置；文本残留字节计入其中
    std::uint64_t pos_ {0};
    std::vector<char> rbuf_;
    size_t rbuf_off_ {0};
    size_t rbuf_len_ {0};
    bool closed_ {false};
};

} // namespace dfsio
