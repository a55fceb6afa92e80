#include "core/io/stream.h"
#include "common/logging.h"

#include <algorithm>
#include <limits>

namespace dfsio {

LineRange::iterator LineRange::begin() {
    if (!started_) {
        started_ = true;
        advance();
    }
    return iterator(this);
}

void LineRange::advance() {
    if (done_) return;
    current_.clear();
    status_ = stream_->readline(current_);
    if (!status_.ok() || current_.empty()) {
        done_ = true;
    }
}

Status open(std::shared_ptr<Session> session,
            const std::string& path,
            const std::string& mode,
            std::unique_ptr<Stream>& out,
            const OpenOptions& opts) {
    OpenMode m;
    Status st = parse_open_mode(mode, m);
    if (!st.ok()) {
        log(LogLevel::DEBUG, "open %s rejected mode=%s: %s", path.c_str(),
            mode.c_str(), st.to_string().c_str());
        return st;
    }

    Encoding enc = Encoding::kUtf8;
    if (!opts.encoding.empty()) {
        if (m.binary) {
            return Status::InvalidArgument("binary mode doesn't take an encoding argument");
        }
        st = parse_encoding(opts.encoding, enc);
        if (!st.ok()) return st;
    }

    std::unique_ptr<FileHandle> fh;
    st = FileHandle::open(std::move(session), path, m, opts.perm, fh);
    if (!st.ok()) return st;

    // 追加模式从文件末尾开始计位置
    std::uint64_t pos = 0;
    if (m.appending()) {
        st = fh->seek_raw(0, Whence::kFromEnd, pos);
        if (!st.ok()) return st;
    }

    size_t bufsz = opts.buffer_size == 0 ? kDefaultBufferSize : opts.buffer_size;
    out.reset(new Stream(std::move(fh), m, enc, bufsz, pos));
    return Status::OK();
}

Stream::Stream(std::unique_ptr<FileHandle> handle, OpenMode mode,
               Encoding enc, size_t buffer_size, std::uint64_t pos)
    : handle_(std::move(handle)),
      mode_(mode),
      name_(handle_->path()),
      decoder_(enc),
      pos_(pos) {
    if (mode_.readable()) {
        rbuf_.resize(buffer_size);
    }
}

Stream::~Stream() {
    if (!closed_) {
        Status st = close();
        if (!st.ok()) {
            log(LogLevel::ERROR, "Stream close on destruction failed name=%s: %s",
                name_.c_str(), st.to_string().c_str());
        }
    }
}

Status Stream::check_open() const {
    if (closed_) {
        return Status::StreamClosed("I/O operation on closed stream: " + name_);
    }
    return Status::OK();
}

Status Stream::check_readable() const {
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.readable()) {
        return Status::UnsupportedOperation("stream not readable: " + name_);
    }
    return Status::OK();
}

Status Stream::fill_buffer(bool& eof) {
    size_t n = 0;
    Status st = handle_->read_raw(rbuf_.data(), rbuf_.size(), n);
    rbuf_off_ = 0;
    rbuf_len_ = n;
    eof = st.ok() && n == 0;
    return st;
}

void Stream::discard_buffer() {
    rbuf_off_ = 0;
    rbuf_len_ = 0;
    decoder_.reset();
}

Status Stream::read(std::int64_t n, std::string& out) {
    out.clear();
    Status st = check_readable();
    if (!st.ok()) return st;
    if (n == 0) return Status::OK();

    return mode_.binary ? read_binary(n, out) : read_text(n, out);
}

Status Stream::read_binary(std::int64_t n, std::string& out) {
    const bool to_eof = n < 0;
    size_t want = to_eof ? std::numeric_limits<size_t>::max()
                         : static_cast<size_t>(n);

    while (out.size() < want) {
        if (buffered() == 0) {
            bool eof = false;
            Status st = fill_buffer(eof);
            if (!st.ok()) return st;
            if (eof) break;
        }
        size_t take = std::min(buffered(), want - out.size());
        out.append(rbuf_.data() + rbuf_off_, take);
        rbuf_off_ += take;
        pos_ += take;
    }
    return Status::OK();
}

Status Stream::read_text(std::int64_t n, std::string& out) {
    size_t chars_left = n < 0 ? std::numeric_limits<size_t>::max()
                              : static_cast<size_t>(n);

    while (chars_left > 0) {
        if (buffered() == 0) {
            bool eof = false;
            Status st = fill_buffer(eof);
            if (!st.ok()) return st;
            if (eof) {
                return decoder_.finish();
            }
        }
        size_t consumed = 0;
        size_t chars = 0;
        Status st = decoder_.decode(rbuf_.data() + rbuf_off_, buffered(),
                                    chars_left, out, consumed, chars);
        rbuf_off_ += consumed;
        pos_ += consumed;
        if (!st.ok()) return st;
        chars_left -= chars;
    }
    return Status::OK();
}

Status Stream::pread(size_t size, std::uint64_t offset, std::string& out) {
    out.clear();
    Status st = check_readable();
    if (!st.ok()) return st;
    if (!mode_.binary) {
        return Status::UnsupportedOperation("pread requires a binary stream: " + name_);
    }

    out.resize(size);
    size_t total = 0;
    while (total < size) {
        size_t n = 0;
        st = handle_->pread_raw(&out[total], size - total, offset + total, n);
        if (!st.ok()) {
            out.clear();
            return st;
        }
        if (n == 0) break;
        total += n;
    }
    out.resize(total);
    return Status::OK();
}

Status Stream::readline(std::string& line) {
    line.clear();
    Status st = check_readable();
    if (!st.ok()) return st;

    for (;;) {
        if (buffered() == 0) {
            bool eof = false;
            st = fill_buffer(eof);
            if (!st.ok()) return st;
            if (eof) {
                return mode_.binary ? Status::OK() : decoder_.finish();
            }
        }

        const char* begin = rbuf_.data() + rbuf_off_;
        const char* end = rbuf_.data() + rbuf_len_;
        const char* nl = std::find(begin, end, '\n');
        const bool found = nl != end;
        size_t take = static_cast<size_t>((found ? nl + 1 : end) - begin);

        if (mode_.binary) {
            line.append(begin, take);
        } else {
            // '\n' 不会出现在多字节序列内部，按字节切分后再解码是安全的
            size_t consumed = 0;
            size_t chars = 0;
            st = decoder_.decode(begin, take, std::numeric_limits<size_t>::max(),
                                 line, consumed, chars);
            if (!st.ok()) {
                rbuf_off_ += consumed;
                pos_ += consumed;
                return st;
            }
        }
        rbuf_off_ += take;
        pos_ += take;
        if (found) return Status::OK();
    }
}

Status Stream::write(const std::string& data) {
    return write(data.data(), data.size());
}

Status Stream::write(const char* data, size_t len) {
    Status st = check_open();
    if (!st.ok()) return st;
    if (!mode_.writable()) {
        return Status::UnsupportedOperation("stream not writable: " + name_);
    }

    std::string encoded;
    if (!mode_.binary) {
        st = encode_text(decoder_.encoding(), std::string(data, len), encoded);
        if (!st.ok()) return st;
        data = encoded.data();
        len = encoded.size();
    }

    if (mode_.appending()) {
        // O_APPEND 下数据总是落在文件末尾，先把账本对齐到末尾
        std::uint64_t end = 0;
        st = handle_->seek_raw(0, Whence::kFromEnd, end);
        if (!st.ok()) return st;
        pos_ = end;
    }

    size_t written = 0;
    st = handle_->write_raw(data, len, written);
    pos_ += written;
    return st;
}

Status Stream::seek(std::int64_t offset, Whence whence, std::uint64_t& out_pos) {
    Status st = check_open();
    if (!st.ok()) return st;

    // 预读之后原生位置领先于账本，相对当前位置的 seek 要换算成绝对位置
    std::int64_t target = offset;
    if (whence == Whence::kFromCurrent) {
        std::uint64_t cur = 0;
        st = tell(cur);
        if (!st.ok()) return st;
        constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
        auto base = static_cast<std::int64_t>(cur);
        if (offset > 0 && offset > kMax - base) {
            return Status::InvalidSeek("seek position overflows: " + std::to_string(cur) +
                                       " + " + std::to_string(offset));
        }
        target = base + offset;
        whence = Whence::kFromStart;
        if (target < 0) {
            return Status::InvalidSeek("negative seek position " + std::to_string(target));
        }
    }

    std::uint64_t pos = 0;
    st = handle_->seek_raw(target, whence, pos);
    if (!st.ok()) return st;

    discard_buffer();
    pos_ = pos;
    out_pos = pos;
    return Status::OK();
}

Status Stream::seek(std::int64_t offset, Whence whence) {
    std::uint64_t pos = 0;
    return seek(offset, whence, pos);
}

Status Stream::tell(std::uint64_t& out_pos) const {
    Status st = check_open();
    if (!st.ok()) return st;
    out_pos = pos_ - decoder_.pending();
    return Status::OK();
}

Status Stream::truncate() {
    std::uint64_t pos = 0;
    Status st = tell(pos);
    if (!st.ok()) return st;
    return truncate(pos);
}

Status Stream::truncate(std::uint64_t size) {
    Status st = check_open();
    if (!st.ok()) return st;
    return handle_->truncate(size);
}

Status Stream::flush() {
    Status st = check_open();
    if (!st.ok()) return st;
    return handle_->flush();
}

Status Stream::stat(FileStat& out) {
    Status st = check_open();
    if (!st.ok()) return st;
    return handle_->stat(out);
}

Status Stream::close() {
    if (closed_) {
        return Status::OK();
    }

    Status first = Status::OK();
    if (mode_.writable()) {
        first = handle_->flush();
    }
    closed_ = true;
    discard_buffer();

    Status st = handle_->close();
    if (!st.ok()) {
        if (first.ok()) {
            first = st;
        } else {
            log(LogLevel::ERROR, "close %s failed after flush error: %s",
                name_.c_str(), st.to_string().c_str());
        }
    }
    return first;
}

} // namespace dfsio
