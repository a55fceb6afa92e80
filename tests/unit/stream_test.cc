#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "core/io/stream.h"
#include "memory_fs_fixture.h"

using namespace dfsio;
using dfsio::test::MemoryFsTest;

class StreamTest : public MemoryFsTest {
protected:
    std::unique_ptr<Stream> open_ok(const std::string& path, const std::string& mode,
                                    const OpenOptions& opts = OpenOptions()) {
        std::unique_ptr<Stream> s;
        Status st = dfsio::open(session_, path, mode, s, opts);
        EXPECT_TRUE(st.ok()) << mode << " " << path << ": " << st.to_string();
        return s;
    }

    std::uint64_t tell(Stream& s) {
        std::uint64_t pos = 0;
        Status st = s.tell(pos);
        EXPECT_TRUE(st.ok()) << st.to_string();
        return pos;
    }
};

TEST_F(StreamTest, OpenThenCloseNeverFailsForSupportedModes) {
    ASSERT_TRUE(write_file("/existing", "abc").ok());
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"rb", "/existing"}, {"r", "/existing"}, {"rt", "/existing"},
        {"wb", "/w1"},       {"w", "/w2"},
        {"ab", "/a1"},       {"a", "/existing"},
        {"xb", "/x1"},       {"x", "/x2"},
    };
    for (const auto& [mode, path] : cases) {
        auto s = open_ok(path, mode);
        ASSERT_NE(s, nullptr);
        EXPECT_TRUE(s->close().ok()) << mode;
        EXPECT_TRUE(s->closed());
        auto calls = fs_->native_calls();
        EXPECT_TRUE(s->close().ok()) << mode;
        EXPECT_EQ(fs_->native_calls(), calls) << mode;
    }
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(StreamTest, BinaryRoundTrip) {
    std::string large(200 * 1024 + 17, '\0');
    for (size_t i = 0; i < large.size(); ++i) {
        large[i] = static_cast<char>((i * 131) & 0xFF);
    }
    const std::vector<std::string> payloads = {
        "",
        std::string("\0", 1),
        std::string("a\0b\0\xff\xfe", 6),
        "hello world\n",
        large,
    };

    for (size_t chunk : {size_t(0), size_t(7)}) {
        fs_->set_max_io_chunk(chunk);
        for (const auto& b : payloads) {
            ASSERT_TRUE(write_file("/rt", b).ok());
            std::string back;
            ASSERT_TRUE(read_file("/rt", back).ok());
            EXPECT_EQ(back.size(), b.size());
            EXPECT_TRUE(back == b) << "payload size " << b.size() << " chunk " << chunk;
        }
    }
}

TEST_F(StreamTest, SeekAndTell) {
    ASSERT_TRUE(write_file("/f", "0123456789").ok());
    FileStat st;
    ASSERT_EQ(fs_->stat(session_->handle(), "/f", st), 0);

    auto s = open_ok("/f", "rb");
    ASSERT_TRUE(s->seek(0, Whence::kFromStart).ok());
    EXPECT_EQ(tell(*s), 0u);

    std::uint64_t pos = 0;
    ASSERT_TRUE(s->seek(0, Whence::kFromEnd, pos).ok());
    EXPECT_EQ(pos, st.size);
    EXPECT_EQ(tell(*s), st.size);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, TellDoesNotCallNative) {
    ASSERT_TRUE(write_file("/f", "0123456789").ok());
    auto s = open_ok("/f", "rb");
    std::string out;
    ASSERT_TRUE(s->read(3, out).ok());

    auto calls = fs_->native_calls();
    EXPECT_EQ(tell(*s), 3u);
    EXPECT_EQ(tell(*s), 3u);
    EXPECT_EQ(fs_->native_calls(), calls);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, OverwriteInPlace) {
    auto w = open_ok("/f", "wb");
    ASSERT_TRUE(w->write("hello world").ok());
    ASSERT_TRUE(w->seek(0).ok());
    ASSERT_TRUE(w->write("hey").ok());
    EXPECT_EQ(tell(*w), 3u);
    ASSERT_TRUE(w->close().ok());

    std::string out;
    ASSERT_TRUE(read_file("/f", out).ok());
    EXPECT_EQ(out, "heylo world");
}

TEST_F(StreamTest, ReadAccumulatesAcrossShortRawReads) {
    ASSERT_TRUE(write_file("/f", "abcdefghijklmnop").ok());
    fs_->set_max_io_chunk(3);

    OpenOptions opts;
    opts.buffer_size = 4;
    auto s = open_ok("/f", "rb", opts);
    std::string out;
    ASSERT_TRUE(s->read(10, out).ok());
    EXPECT_EQ(out, "abcdefghij");
    ASSERT_TRUE(s->read(100, out).ok());
    EXPECT_EQ(out, "klmnop");
    EXPECT_EQ(tell(*s), 16u);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, ReadPastEndIsEmptyAndIdempotent) {
    ASSERT_TRUE(write_file("/f", "xyz").ok());
    auto s = open_ok("/f", "rb");
    std::string out;
    ASSERT_TRUE(s->read_all(out).ok());
    EXPECT_EQ(out, "xyz");
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(s->read(10, out).ok());
        EXPECT_TRUE(out.empty());
        ASSERT_TRUE(s->read_all(out).ok());
        EXPECT_TRUE(out.empty());
        ASSERT_TRUE(s->readline(out).ok());
        EXPECT_TRUE(out.empty());
    }
    EXPECT_EQ(tell(*s), 3u);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, SeekDiscardsReadAheadBuffer) {
    ASSERT_TRUE(write_file("/f", "0123456789").ok());
    auto s = open_ok("/f", "rb");
    std::string out;
    ASSERT_TRUE(s->read(2, out).ok());
    EXPECT_EQ(out, "01");

    ASSERT_TRUE(s->seek(5).ok());
    ASSERT_TRUE(s->read(3, out).ok());
    EXPECT_EQ(out, "567");

    // 相对当前位置的 seek 以账本为准，而不是原生位置
    std::uint64_t pos = 0;
    ASSERT_TRUE(s->seek(-6, Whence::kFromCurrent, pos).ok());
    EXPECT_EQ(pos, 2u);
    ASSERT_TRUE(s->read(2, out).ok());
    EXPECT_EQ(out, "23");
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, PreadDoesNotMoveLedgerOrBuffer) {
    ASSERT_TRUE(write_file("/f", "0123456789").ok());
    fs_->set_max_io_chunk(2);
    auto s = open_ok("/f", "rb");
    std::string out;
    ASSERT_TRUE(s->read(1, out).ok());
    EXPECT_EQ(out, "0");

    ASSERT_TRUE(s->pread(5, 4, out).ok());
    EXPECT_EQ(out, "45678");
    ASSERT_TRUE(s->pread(5, 8, out).ok());
    EXPECT_EQ(out, "89");
    EXPECT_EQ(tell(*s), 1u);

    ASSERT_TRUE(s->read(2, out).ok());
    EXPECT_EQ(out, "12");
    ASSERT_TRUE(s->close().ok());
    EXPECT_EQ(s->pread(1, 0, out).code(), StatusCode::kStreamClosed);
}

TEST_F(StreamTest, PreadNeedsBinaryReader) {
    ASSERT_TRUE(write_file("/f", "abc").ok());
    std::string out;
    auto t = open_ok("/f", "r");
    EXPECT_EQ(t->pread(1, 0, out).code(), StatusCode::kUnsupportedOperation);
    ASSERT_TRUE(t->close().ok());

    auto w = open_ok("/g", "wb");
    EXPECT_EQ(w->pread(1, 0, out).code(), StatusCode::kUnsupportedOperation);
    ASSERT_TRUE(w->close().ok());
}

TEST_F(StreamTest, SeekSeesDataWrittenAfterBuffering) {
    ASSERT_TRUE(write_file("/f", "aaaa").ok());
    auto r = open_ok("/f", "rb");
    std::string out;
    ASSERT_TRUE(r->read(1, out).ok());

    ASSERT_TRUE(write_file("/f", "bbbb").ok());
    ASSERT_TRUE(r->seek(0).ok());
    ASSERT_TRUE(r->read_all(out).ok());
    EXPECT_EQ(out, "bbbb");
    ASSERT_TRUE(r->close().ok());
}

TEST_F(StreamTest, NegativeSeekIsInvalidSeek) {
    ASSERT_TRUE(write_file("/f", "abc").ok());
    auto s = open_ok("/f", "rb");
    EXPECT_EQ(s->seek(-1).code(), StatusCode::kInvalidSeek);
    EXPECT_EQ(s->seek(-4, Whence::kFromCurrent).code(), StatusCode::kInvalidSeek);
    EXPECT_EQ(s->seek(-4, Whence::kFromEnd).code(), StatusCode::kInvalidSeek);
    EXPECT_EQ(tell(*s), 0u);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, RelativeSeekPastInt64MaxIsInvalidSeek) {
    ASSERT_TRUE(write_file("/f", "abc").ok());
    auto s = open_ok("/f", "rb");
    ASSERT_TRUE(s->seek(2).ok());

    auto calls = fs_->native_calls();
    EXPECT_EQ(s->seek(std::numeric_limits<std::int64_t>::max(), Whence::kFromCurrent).code(),
              StatusCode::kInvalidSeek);
    EXPECT_EQ(fs_->native_calls(), calls);
    EXPECT_EQ(tell(*s), 2u);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, UnsupportedModeFailsBeforeAnyNativeCall) {
    auto calls = fs_->native_calls();
    for (const char* mode : {"rb+", "wb+", "ab+", "r+", "a+"}) {
        std::unique_ptr<Stream> s;
        EXPECT_EQ(dfsio::open(session_, "/f", mode, s).code(),
                  StatusCode::kUnsupportedMode) << mode;
        EXPECT_EQ(s, nullptr);
    }
    EXPECT_EQ(fs_->native_calls(), calls);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(StreamTest, EncodingIsRejectedForBinaryModes) {
    OpenOptions opts;
    opts.encoding = "utf-8";
    std::unique_ptr<Stream> s;
    EXPECT_EQ(dfsio::open(session_, "/f", "wb", s, opts).code(),
              StatusCode::kInvalidArgument);
    opts.encoding = "ebcdic";
    EXPECT_EQ(dfsio::open(session_, "/f", "w", s, opts).code(),
              StatusCode::kInvalidArgument);
}

TEST_F(StreamTest, AppendWritesLandAtEnd) {
    ASSERT_TRUE(write_file("/log", "abc").ok());
    auto a = open_ok("/log", "ab");
    EXPECT_EQ(tell(*a), 3u);

    // 另一个写者在中途扩展了文件
    ASSERT_TRUE(write_file("/log", "abcdef").ok());
    ASSERT_TRUE(a->write("XY").ok());
    EXPECT_EQ(tell(*a), 8u);
    ASSERT_TRUE(a->close().ok());

    std::string out;
    ASSERT_TRUE(read_file("/log", out).ok());
    EXPECT_EQ(out, "abcdefXY");
}

TEST_F(StreamTest, ExclusiveCreateFailsIfPresent) {
    ASSERT_TRUE(write_file("/f", "x").ok());
    std::unique_ptr<Stream> s;
    EXPECT_EQ(dfsio::open(session_, "/f", "xb", s).code(), StatusCode::kAlreadyExists);
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(StreamTest, ShortWriteAdvancesLedgerByAcceptedBytes) {
    auto w = open_ok("/f", "wb");
    fs_->set_write_budget(4);
    Status st = w->write("0123456789");
    EXPECT_EQ(st.code(), StatusCode::kShortWrite);
    EXPECT_EQ(tell(*w), 4u);
    fs_->set_write_budget(-1);
    ASSERT_TRUE(w->close().ok());

    std::string out;
    ASSERT_TRUE(read_file("/f", out).ok());
    EXPECT_EQ(out, "0123");
}

TEST_F(StreamTest, WrongDirectionIsUnsupportedOperation) {
    auto w = open_ok("/f", "wb");
    std::string out;
    EXPECT_EQ(w->read(1, out).code(), StatusCode::kUnsupportedOperation);
    EXPECT_EQ(w->readline(out).code(), StatusCode::kUnsupportedOperation);
    EXPECT_FALSE(w->readable());
    EXPECT_TRUE(w->writable());
    ASSERT_TRUE(w->close().ok());

    auto r = open_ok("/f", "rb");
    EXPECT_EQ(r->write("x").code(), StatusCode::kUnsupportedOperation);
    EXPECT_TRUE(r->readable());
    EXPECT_FALSE(r->writable());
    ASSERT_TRUE(r->close().ok());
}

TEST_F(StreamTest, ClosedStreamRejectsOperations) {
    auto s = open_ok("/f", "wb");
    ASSERT_TRUE(s->close().ok());

    std::string out;
    std::uint64_t pos = 0;
    FileStat st;
    EXPECT_EQ(s->write("x").code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->read(1, out).code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->readline(out).code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->seek(0).code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->tell(pos).code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->flush().code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->truncate().code(), StatusCode::kStreamClosed);
    EXPECT_EQ(s->stat(st).code(), StatusCode::kStreamClosed);
    EXPECT_TRUE(s->close().ok());
}

TEST_F(StreamTest, ScopeExitClosesStream) {
    {
        auto s = open_ok("/f", "wb");
        ASSERT_TRUE(s->write("abc").ok());
        EXPECT_EQ(session_->open_handles(), 1u);
    }
    EXPECT_EQ(session_->open_handles(), 0u);
    EXPECT_EQ(fs_->open_fd_count(), 0u);

    std::string out;
    ASSERT_TRUE(read_file("/f", out).ok());
    EXPECT_EQ(out, "abc");
}

TEST_F(StreamTest, ScopeExitClosesStreamOnErrorPath) {
    auto body = [this]() -> Status {
        std::unique_ptr<Stream> s;
        Status st = dfsio::open(session_, "/f", "wb", s);
        if (!st.ok()) return st;
        fs_->set_write_budget(0);
        st = s->write("abc");
        if (!st.ok()) return st;
        return s->close();
    };
    EXPECT_EQ(body().code(), StatusCode::kShortWrite);
    EXPECT_EQ(session_->open_handles(), 0u);
    EXPECT_EQ(fs_->open_fd_count(), 0u);
}

TEST_F(StreamTest, ReadlineAndLines) {
    ASSERT_TRUE(write_file("/f", "a\nbb\n\nccc").ok());
    OpenOptions opts;
    opts.buffer_size = 2;
    auto s = open_ok("/f", "rb", opts);

    std::string line;
    ASSERT_TRUE(s->readline(line).ok());
    EXPECT_EQ(line, "a\n");
    EXPECT_EQ(tell(*s), 2u);

    std::vector<std::string> rest;
    auto lines = s->lines();
    for (const auto& l : lines) {
        rest.push_back(l);
    }
    EXPECT_TRUE(lines.status().ok());
    EXPECT_EQ(rest, (std::vector<std::string>{"bb\n", "\n", "ccc"}));

    // 迭代结束之后只能通过 seek 重新开始
    std::vector<std::string> again;
    for (const auto& l : s->lines()) again.push_back(l);
    EXPECT_TRUE(again.empty());

    ASSERT_TRUE(s->seek(0).ok());
    for (const auto& l : s->lines()) again.push_back(l);
    EXPECT_EQ(again.size(), 4u);
    ASSERT_TRUE(s->close().ok());
}

TEST_F(StreamTest, LinesReportsFailure) {
    ASSERT_TRUE(write_file("/f", "one\ntwo\n").ok());
    auto s = open_ok("/f", "rb");
    auto lines = s->lines();
    auto it = lines.begin();
    ASSERT_NE(it, lines.end());
    EXPECT_EQ(*it, "one\n");
    ASSERT_TRUE(s->close().ok());
    ++it;
    EXPECT_EQ(it, lines.end());
    EXPECT_EQ(lines.status().code(), StatusCode::kStreamClosed);
}

TEST_F(StreamTest, TruncateDefaultsToCurrentPosition) {
    auto w = open_ok("/f", "wb");
    ASSERT_TRUE(w->write("0123456789").ok());
    ASSERT_TRUE(w->seek(4).ok());
    ASSERT_TRUE(w->truncate().ok());
    EXPECT_EQ(tell(*w), 4u);

    FileStat st;
    ASSERT_TRUE(w->stat(st).ok());
    EXPECT_EQ(st.size, 4u);
    ASSERT_TRUE(w->truncate(2).ok());
    ASSERT_TRUE(w->flush().ok());
    ASSERT_TRUE(w->close().ok());

    std::string out;
    ASSERT_TRUE(read_file("/f", out).ok());
    EXPECT_EQ(out, "01");
}

TEST_F(StreamTest, ModeAndName) {
    auto s = open_ok("/dir/../f", "wb");
    EXPECT_EQ(s->name(), "/f");
    EXPECT_EQ(s->mode(), "wb");
    EXPECT_TRUE(s->binary());
    ASSERT_TRUE(s->close().ok());
}
