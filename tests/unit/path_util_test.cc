#include <gtest/gtest.h>

#include "core/namespace/path_util.h"

using namespace dfsio;

namespace {

std::string norm(const std::string& in) {
    std::string out;
    Status st = path::normalize(in, out);
    EXPECT_TRUE(st.ok()) << in << ": " << st.to_string();
    return out;
}

} // namespace

TEST(PathUtilTest, Normalize) {
    EXPECT_EQ(norm("/"), "/");
    EXPECT_EQ(norm("a"), "/a");
    EXPECT_EQ(norm("/a/b/"), "/a/b");
    EXPECT_EQ(norm("a//b/./c/../d/"), "/a/b/d");
    EXPECT_EQ(norm("/.."), "/");
    EXPECT_EQ(norm("/../../x"), "/x");
    EXPECT_EQ(norm("."), "/");
}

TEST(PathUtilTest, NormalizeRejectsEmptyAndNul) {
    std::string out;
    EXPECT_EQ(path::normalize("", out).code(), StatusCode::kInvalidArgument);
    EXPECT_EQ(path::normalize(std::string("/a\0b", 4), out).code(),
              StatusCode::kInvalidArgument);
}

TEST(PathUtilTest, JoinDirnameBasename) {
    EXPECT_EQ(path::join("/a", "b"), "/a/b");
    EXPECT_EQ(path::join("/", "b"), "/b");
    EXPECT_EQ(path::join("/a", "/c"), "/c");

    EXPECT_EQ(path::dirname("/a/b"), "/a");
    EXPECT_EQ(path::dirname("/a"), "/");
    EXPECT_EQ(path::basename("/a/b"), "b");
    EXPECT_EQ(path::basename("/"), "");

    auto parts = path::split("/x/y/z");
    EXPECT_EQ(parts.first, "/x/y");
    EXPECT_EQ(parts.second, "z");

    EXPECT_TRUE(path::is_root("/"));
    EXPECT_FALSE(path::is_root("/a"));
}
