#include <gtest/gtest.h>

#include <algorithm>
#include <sys/xattr.h>
#include <unistd.h>

#include "core/namespace/namespace_service.h"
#include "memory_fs_fixture.h"

using namespace dfsio;
using dfsio::test::MemoryFsTest;

class NamespaceServiceTest : public MemoryFsTest {
protected:
    void SetUp() override {
        MemoryFsTest::SetUp();
        ns_.reset(new NamespaceService(session_));
    }

    void TearDown() override {
        ns_.reset();
        MemoryFsTest::TearDown();
    }

    bool exists(const std::string& p) {
        bool out = false;
        Status st = ns_->exists(p, out);
        EXPECT_TRUE(st.ok()) << p << ": " << st.to_string();
        return out;
    }

    std::vector<std::string> listdir(const std::string& p) {
        std::vector<std::string> names;
        Status st = ns_->listdir(p, names);
        EXPECT_TRUE(st.ok()) << p << ": " << st.to_string();
        std::sort(names.begin(), names.end());
        return names;
    }

    std::unique_ptr<NamespaceService> ns_;
};

TEST_F(NamespaceServiceTest, ExistsNeverFailsForMissingPaths) {
    EXPECT_FALSE(exists("/never"));
    EXPECT_FALSE(exists("/never/deeper"));
    ASSERT_TRUE(ns_->create("/fresh").ok());
    EXPECT_TRUE(exists("/fresh"));
    EXPECT_TRUE(exists("fresh"));
    EXPECT_FALSE(exists("/fresh/child"));
    EXPECT_TRUE(exists("/"));
}

TEST_F(NamespaceServiceTest, ExistsReportsOtherErrors) {
    // 指向自身的链接，解析时得到 ELOOP
    ASSERT_TRUE(ns_->symlink("/loop", "/loop").ok());
    bool out = true;
    Status st = ns_->exists("/loop", out);
    EXPECT_FALSE(st.ok());
    EXPECT_EQ(st.code(), StatusCode::kPathOther);
    EXPECT_FALSE(out);

    bool lout = false;
    ASSERT_TRUE(ns_->lexists("/loop", lout).ok());
    EXPECT_TRUE(lout);
}

TEST_F(NamespaceServiceTest, ListdirOfEmptyDirectoryIsEmpty) {
    ASSERT_TRUE(ns_->mkdir("/empty").ok());
    EXPECT_TRUE(listdir("/empty").empty());
    EXPECT_TRUE(listdir("/").size() == 1);
}

TEST_F(NamespaceServiceTest, ListdirErrors) {
    std::vector<std::string> names;
    EXPECT_EQ(ns_->listdir("/nope", names).code(), StatusCode::kNotFound);
    ASSERT_TRUE(ns_->create("/file").ok());
    EXPECT_EQ(ns_->listdir("/file", names).code(), StatusCode::kNotADirectory);
}

TEST_F(NamespaceServiceTest, ListdirFollowsNativePagination) {
    ASSERT_TRUE(ns_->mkdir("/d").ok());
    std::vector<std::string> expected;
    for (int i = 0; i < 25; ++i) {
        std::string name = "f" + std::to_string(100 + i);
        ASSERT_TRUE(ns_->create("/d/" + name).ok());
        expected.push_back(name);
    }
    fs_->set_listdir_page_size(4);

    auto before = fs_->listdir_calls();
    EXPECT_EQ(listdir("/d"), expected);
    EXPECT_GE(fs_->listdir_calls() - before, 7u);
}

TEST_F(NamespaceServiceTest, ScandirIsLazy) {
    ASSERT_TRUE(ns_->mkdir("/d").ok());
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(ns_->create("/d/f" + std::to_string(i)).ok());
    }
    ASSERT_TRUE(ns_->mkdir("/d/sub").ok());
    fs_->set_listdir_page_size(3);

    std::unique_ptr<DirReader> reader;
    auto before = fs_->listdir_calls();
    ASSERT_TRUE(ns_->scandir("/d", reader).ok());
    EXPECT_EQ(fs_->listdir_calls(), before);

    DirEntry e;
    bool done = false;
    ASSERT_TRUE(reader->next(e, done).ok());
    EXPECT_FALSE(done);
    EXPECT_EQ(fs_->listdir_calls(), before + 1);

    size_t count = 1;
    size_t dirs = e.kind == FileKind::kDirectory ? 1 : 0;
    for (;;) {
        ASSERT_TRUE(reader->next(e, done).ok());
        if (done) break;
        ++count;
        if (e.kind == FileKind::kDirectory) ++dirs;
        EXPECT_EQ(e.name.find('/'), std::string::npos);
    }
    EXPECT_EQ(count, 11u);
    EXPECT_EQ(dirs, 1u);

    ASSERT_TRUE(reader->next(e, done).ok());
    EXPECT_TRUE(done);
}

TEST_F(NamespaceServiceTest, MakedirsCreatesIntermediates) {
    ASSERT_TRUE(ns_->makedirs("/a/b/c").ok());
    bool is_dir = false;
    ASSERT_TRUE(ns_->is_dir("/a/b/c", is_dir).ok());
    EXPECT_TRUE(is_dir);

    EXPECT_EQ(ns_->makedirs("/a/b/c").code(), StatusCode::kAlreadyExists);
    EXPECT_TRUE(ns_->makedirs("/a/b/c", kDefaultDirMode, true).ok());
    EXPECT_TRUE(ns_->makedirs("/", kDefaultDirMode, true).ok());

    // 叶子是文件时即使 exist_ok 也失败
    ASSERT_TRUE(ns_->create("/a/file").ok());
    EXPECT_EQ(ns_->makedirs("/a/file", kDefaultDirMode, true).code(),
              StatusCode::kAlreadyExists);
    EXPECT_EQ(ns_->makedirs("/a/file/x").code(), StatusCode::kNotADirectory);
}

TEST_F(NamespaceServiceTest, MkdirRmdirErrors) {
    ASSERT_TRUE(ns_->mkdir("/d").ok());
    EXPECT_EQ(ns_->mkdir("/d").code(), StatusCode::kAlreadyExists);
    EXPECT_EQ(ns_->mkdir("/x/y").code(), StatusCode::kNotFound);

    ASSERT_TRUE(ns_->create("/d/f").ok());
    Status st = ns_->rmdir("/d");
    EXPECT_EQ(st.code(), StatusCode::kPathOther);
    EXPECT_EQ(st.native_errno(), ENOTEMPTY);
    EXPECT_EQ(ns_->rmdir("/d/f").code(), StatusCode::kNotADirectory);

    ASSERT_TRUE(ns_->remove("/d/f").ok());
    ASSERT_TRUE(ns_->rmdir("/d").ok());
    EXPECT_FALSE(exists("/d"));
}

TEST_F(NamespaceServiceTest, RemovedirsPrunesEmptyParents) {
    ASSERT_TRUE(ns_->makedirs("/p/q/r").ok());
    ASSERT_TRUE(ns_->create("/p/keep").ok());
    ASSERT_TRUE(ns_->removedirs("/p/q/r").ok());
    EXPECT_FALSE(exists("/p/q"));
    EXPECT_TRUE(exists("/p"));
    EXPECT_EQ(ns_->removedirs("/p/q/r").code(), StatusCode::kNotFound);
}

TEST_F(NamespaceServiceTest, RemoveRejectsDirectories) {
    ASSERT_TRUE(ns_->mkdir("/d").ok());
    EXPECT_EQ(ns_->remove("/d").code(), StatusCode::kIsADirectory);
    EXPECT_EQ(ns_->unlink("/missing").code(), StatusCode::kNotFound);
}

TEST_F(NamespaceServiceTest, RenameMovesFiles) {
    ASSERT_TRUE(write_file("/src", "payload").ok());
    ASSERT_TRUE(ns_->mkdir("/dir").ok());
    ASSERT_TRUE(ns_->rename("/src", "/dir/dst").ok());
    EXPECT_FALSE(exists("/src"));

    std::string out;
    ASSERT_TRUE(read_file("/dir/dst", out).ok());
    EXPECT_EQ(out, "payload");

    EXPECT_EQ(ns_->rename("/missing", "/x").code(), StatusCode::kNotFound);
    ASSERT_TRUE(ns_->create("/file").ok());
    EXPECT_EQ(ns_->rename("/file", "/dir").code(), StatusCode::kIsADirectory);
}

TEST_F(NamespaceServiceTest, SymlinkAndReadlink) {
    ASSERT_TRUE(write_file("/target", "via link").ok());
    ASSERT_TRUE(ns_->symlink("target", "/link").ok());
    EXPECT_EQ(ns_->symlink("target", "/link").code(), StatusCode::kAlreadyExists);

    std::string target;
    ASSERT_TRUE(ns_->readlink("/link", target).ok());
    EXPECT_EQ(target, "target");
    EXPECT_EQ(ns_->readlink("/target", target).code(), StatusCode::kPathOther);

    bool is_link = false;
    bool is_file = false;
    ASSERT_TRUE(ns_->is_link("/link", is_link).ok());
    ASSERT_TRUE(ns_->is_file("/link", is_file).ok());
    EXPECT_TRUE(is_link);
    EXPECT_TRUE(is_file);

    std::string out;
    ASSERT_TRUE(read_file("/link", out).ok());
    EXPECT_EQ(out, "via link");

    // 悬空链接：lexists 为真，exists 为假
    ASSERT_TRUE(ns_->symlink("/gone", "/dangling").ok());
    bool lex = false;
    ASSERT_TRUE(ns_->lexists("/dangling", lex).ok());
    EXPECT_TRUE(lex);
    EXPECT_FALSE(exists("/dangling"));
}

TEST_F(NamespaceServiceTest, StatAndAttributes) {
    ASSERT_TRUE(write_file("/f", "12345").ok());

    std::uint64_t size = 0;
    ASSERT_TRUE(ns_->get_size("/f", size).ok());
    EXPECT_EQ(size, 5u);
    EXPECT_EQ(ns_->get_size("/missing", size).code(), StatusCode::kNotFound);

    ASSERT_TRUE(ns_->chmod("/f", 0600).ok());
    ASSERT_TRUE(ns_->chown("/f", 1000, 100).ok());
    ASSERT_TRUE(ns_->utime("/f", 1000, 2000).ok());

    FileStat st;
    ASSERT_TRUE(ns_->stat("/f", st).ok());
    EXPECT_EQ(st.permissions(), 0600u);
    EXPECT_EQ(st.uid, 1000u);
    EXPECT_EQ(st.gid, 100u);
    EXPECT_EQ(st.kind(), FileKind::kFile);

    std::uint64_t atime = 0;
    std::uint64_t mtime = 0;
    ASSERT_TRUE(ns_->get_atime("/f", atime).ok());
    ASSERT_TRUE(ns_->get_mtime("/f", mtime).ok());
    EXPECT_EQ(atime, 1000u);
    EXPECT_EQ(mtime, 2000u);

    ASSERT_TRUE(ns_->utime("/f").ok());
    ASSERT_TRUE(ns_->get_mtime("/f", mtime).ok());
    EXPECT_GT(mtime, 2000u);

    ASSERT_TRUE(ns_->truncate("/f", 2).ok());
    ASSERT_TRUE(ns_->get_size("/f", size).ok());
    EXPECT_EQ(size, 2u);
}

TEST_F(NamespaceServiceTest, CreateIsExclusive) {
    ASSERT_TRUE(ns_->create("/c", 0640).ok());
    EXPECT_EQ(ns_->create("/c").code(), StatusCode::kAlreadyExists);
    FileStat st;
    ASSERT_TRUE(ns_->lstat("/c", st).ok());
    EXPECT_EQ(st.permissions(), 0640u);
    EXPECT_EQ(st.size, 0u);
}

TEST_F(NamespaceServiceTest, WalkTopDownAndBottomUp) {
    ASSERT_TRUE(ns_->makedirs("/w/a/b").ok());
    ASSERT_TRUE(ns_->create("/w/top.txt").ok());
    ASSERT_TRUE(ns_->create("/w/a/mid.txt").ok());
    ASSERT_TRUE(ns_->create("/w/a/b/leaf.txt").ok());
    ASSERT_TRUE(ns_->symlink("/w/a", "/w/link_to_a").ok());

    std::vector<std::string> order;
    auto visitor = [&order](const std::string& dirpath, std::vector<std::string>& dirs,
                            const std::vector<std::string>& files) {
        order.push_back(dirpath);
        if (dirpath == "/w") {
            std::vector<std::string> sorted = dirs;
            std::sort(sorted.begin(), sorted.end());
            EXPECT_EQ(sorted, (std::vector<std::string>{"a", "link_to_a"}));
            EXPECT_EQ(files, (std::vector<std::string>{"top.txt"}));
        }
        return Status::OK();
    };

    ASSERT_TRUE(ns_->walk("/w", true, visitor).ok());
    EXPECT_EQ(order, (std::vector<std::string>{"/w", "/w/a", "/w/a/b"}));

    order.clear();
    ASSERT_TRUE(ns_->walk("/w", false, visitor).ok());
    EXPECT_EQ(order, (std::vector<std::string>{"/w/a/b", "/w/a", "/w"}));
}

TEST_F(NamespaceServiceTest, WalkPrunesAndStops) {
    ASSERT_TRUE(ns_->makedirs("/w/skip/deep").ok());
    ASSERT_TRUE(ns_->makedirs("/w/keep").ok());

    std::vector<std::string> seen;
    Status st = ns_->walk("/w", true,
        [&seen](const std::string& dirpath, std::vector<std::string>& dirs,
                const std::vector<std::string>&) {
            seen.push_back(dirpath);
            dirs.erase(std::remove(dirs.begin(), dirs.end(), "skip"), dirs.end());
            return Status::OK();
        });
    ASSERT_TRUE(st.ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"/w", "/w/keep"}));

    st = ns_->walk("/w", true,
        [](const std::string&, std::vector<std::string>&, const std::vector<std::string>&) {
            return Status::InvalidArgument("stop");
        });
    EXPECT_EQ(st.code(), StatusCode::kInvalidArgument);
}

TEST_F(NamespaceServiceTest, RmtreeAndSummary) {
    ASSERT_TRUE(ns_->makedirs("/t/x/y").ok());
    ASSERT_TRUE(write_file("/t/one", "1").ok());
    ASSERT_TRUE(write_file("/t/x/two", "22").ok());
    ASSERT_TRUE(write_file("/t/x/y/three", "333").ok());
    ASSERT_TRUE(ns_->symlink("/t/x", "/t/link").ok());

    DirSummary sum;
    ASSERT_TRUE(ns_->summary("/t", sum).ok());
    EXPECT_EQ(sum.dirs, 3u);
    EXPECT_EQ(sum.files, 4u);
    EXPECT_EQ(sum.size, 1u + 2u + 3u + std::string("/t/x").size());

    ASSERT_TRUE(ns_->summary("/t/one", sum).ok());
    EXPECT_EQ(sum.files, 1u);
    EXPECT_EQ(sum.dirs, 0u);

    fs_->set_listdir_page_size(1);
    ASSERT_TRUE(ns_->rmtree("/t").ok());
    EXPECT_FALSE(exists("/t"));
    EXPECT_EQ(ns_->rmtree("/").code(), StatusCode::kInvalidArgument);
}

TEST_F(NamespaceServiceTest, Statvfs) {
    StatVfs v;
    ASSERT_TRUE(ns_->statvfs(v).ok());
    EXPECT_GT(v.block_size, 0u);
    EXPECT_GT(v.blocks, 0u);
}

TEST_F(NamespaceServiceTest, ExtendedAttributes) {
    ASSERT_TRUE(ns_->create("/x").ok());

    std::optional<std::string> value;
    ASSERT_TRUE(ns_->getxattr("/x", "user.k", value).ok());
    EXPECT_FALSE(value.has_value());

    ASSERT_TRUE(ns_->setxattr("/x", "user.k", "v1").ok());
    EXPECT_EQ(ns_->setxattr("/x", "user.k", "v2", XATTR_CREATE).code(),
              StatusCode::kAlreadyExists);
    ASSERT_TRUE(ns_->setxattr("/x", "user.k", "v2", XATTR_REPLACE).ok());
    ASSERT_TRUE(ns_->getxattr("/x", "user.k", value).ok());
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "v2");

    std::vector<std::string> names;
    ASSERT_TRUE(ns_->listxattr("/x", names).ok());
    EXPECT_EQ(names, (std::vector<std::string>{"user.k"}));

    ASSERT_TRUE(ns_->removexattr("/x", "user.k").ok());
    ASSERT_TRUE(ns_->getxattr("/x", "user.k", value).ok());
    EXPECT_FALSE(value.has_value());

    EXPECT_EQ(ns_->getxattr("/missing", "user.k", value).code(), StatusCode::kNotFound);
}

TEST_F(NamespaceServiceTest, ClosedSessionFailsFacadeCalls) {
    ASSERT_TRUE(close_session(session_).ok());
    bool out = false;
    EXPECT_EQ(ns_->exists("/", out).code(), StatusCode::kSessionClosed);
    std::vector<std::string> names;
    EXPECT_EQ(ns_->listdir("/", names).code(), StatusCode::kSessionClosed);
    StatVfs v;
    EXPECT_EQ(ns_->statvfs(v).code(), StatusCode::kSessionClosed);
}

TEST_F(NamespaceServiceTest, AccessFollowsPermissionBits) {
    ASSERT_TRUE(ns_->create("/exe", 0644).ok());

    bool ok = false;
    ASSERT_TRUE(ns_->access("/exe", F_OK, ok).ok());
    EXPECT_TRUE(ok);
    ASSERT_TRUE(ns_->access("/exe", R_OK, ok).ok());
    EXPECT_TRUE(ok);
    ASSERT_TRUE(ns_->access("/exe", X_OK, ok).ok());
    EXPECT_FALSE(ok);

    ASSERT_TRUE(ns_->chmod("/exe", 0755).ok());
    ASSERT_TRUE(ns_->access("/exe", R_OK | X_OK, ok).ok());
    EXPECT_TRUE(ok);

    ASSERT_TRUE(ns_->access("/missing", F_OK, ok).ok());
    EXPECT_FALSE(ok);
    EXPECT_EQ(ns_->access("/exe", 0100, ok).code(), StatusCode::kInvalidArgument);
}

TEST_F(NamespaceServiceTest, AccessDeniesWriteOnReadOnlySession) {
    ASSERT_TRUE(ns_->create("/f", 0666).ok());
    std::shared_ptr<Session> ro;
    ASSERT_TRUE(open_session("ro", {{"read_only", "true"}}, ro).ok());
    NamespaceService ro_ns(ro);

    bool ok = true;
    ASSERT_TRUE(ro_ns.access("/", W_OK, ok).ok());
    EXPECT_FALSE(ok);
    ASSERT_TRUE(ro_ns.access("/", F_OK, ok).ok());
    EXPECT_TRUE(ok);
}

TEST_F(NamespaceServiceTest, ConcatAppendsSourcesInOrder) {
    ASSERT_TRUE(write_file("/dst", "head-").ok());
    ASSERT_TRUE(write_file("/a", "alpha-").ok());
    ASSERT_TRUE(write_file("/b", "beta").ok());
    ASSERT_TRUE(ns_->create("/empty").ok());

    ASSERT_TRUE(ns_->concat("/dst", {"/a", "/empty", "/b"}).ok());
    std::string content;
    ASSERT_TRUE(read_file("/dst", content).ok());
    EXPECT_EQ(content, "head-alpha-beta");

    // 源文件保持不变
    ASSERT_TRUE(read_file("/a", content).ok());
    EXPECT_EQ(content, "alpha-");
    EXPECT_EQ(session_->open_handles(), 0u);
}

TEST_F(NamespaceServiceTest, ConcatChecksAllSourcesFirst) {
    ASSERT_TRUE(write_file("/dst", "x").ok());
    ASSERT_TRUE(write_file("/a", "a").ok());
    ASSERT_TRUE(ns_->mkdir("/dir").ok());

    EXPECT_EQ(ns_->concat("/dst", {"/a", "/missing"}).code(), StatusCode::kNotFound);
    EXPECT_EQ(ns_->concat("/dst", {"/dir"}).code(), StatusCode::kIsADirectory);
    EXPECT_EQ(ns_->concat("/dst", {"/a", "/dst"}).code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(ns_->concat("/nodst", {"/a"}).code(), StatusCode::kNotFound);

    std::string content;
    ASSERT_TRUE(read_file("/dst", content).ok());
    EXPECT_EQ(content, "x");
    EXPECT_FALSE(exists("/nodst"));
}
