#include "sandbox/path_guard.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using sandbox::PathGuard;

// NOLINTNEXTLINE
TEST(PathGuard, Normalize) {
  EXPECT_EQ(PathGuard::Normalize("/a/./b//c/", "/"), "/a/b/c");
  EXPECT_EQ(PathGuard::Normalize("/a/b/../c", "/"), "/a/c");
  EXPECT_EQ(PathGuard::Normalize("../../..", "/a"), "/");
  EXPECT_EQ(PathGuard::Normalize("x/y", "/box"), "/box/x/y");
  EXPECT_EQ(PathGuard::Normalize("", "/box"), "/box");
}

// NOLINTNEXTLINE
TEST(PathGuard, IsUnderUsesSeparatorBoundary) {
  EXPECT_TRUE(PathGuard::IsUnder("/tmp/box", "/tmp/box"));
  EXPECT_TRUE(PathGuard::IsUnder("/tmp/box/a", "/tmp/box"));
  EXPECT_FALSE(PathGuard::IsUnder("/tmp/boxer", "/tmp/box"));
  EXPECT_TRUE(PathGuard::IsUnder("/anything", "/"));
}

// NOLINTNEXTLINE
TEST(PathGuard, InsideRootIsAllowed) {
  PathGuard guard("/tmp/sb/box");
  EXPECT_TRUE(guard.IsAllowed("/tmp/sb/box/out.txt", PathGuard::Access::kWrite));
  EXPECT_TRUE(guard.IsAllowed("out.txt", PathGuard::Access::kWrite));
  EXPECT_TRUE(guard.IsAllowed("home/../temp/x", PathGuard::Access::kWrite));
}

// NOLINTNEXTLINE
TEST(PathGuard, EscapesAreDenied) {
  PathGuard guard("/tmp/sb/box");
  EXPECT_FALSE(guard.IsAllowed("/etc/passwd", PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed("../guard/x", PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed("/tmp/sb/box/../../../etc/shadow",
                               PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed("/tmp/sb/boxer/x", PathGuard::Access::kWrite));
  EXPECT_FALSE(guard.IsAllowed("", PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed(std::string("a\0b", 3),
                               PathGuard::Access::kRead));
}

// NOLINTNEXTLINE
TEST(PathGuard, ReadOnlyRoots) {
  PathGuard guard("/tmp/sb/box", {"/usr/lib/python3", "/tmp/sb/guard/"});
  EXPECT_TRUE(guard.IsAllowed("/usr/lib/python3/os.py",
                              PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed("/usr/lib/python3/os.py",
                               PathGuard::Access::kWrite));
  EXPECT_TRUE(guard.IsAllowed("../guard/sitecustomize.py",
                              PathGuard::Access::kRead));
  EXPECT_FALSE(guard.IsAllowed("../guard/sitecustomize.py",
                               PathGuard::Access::kWrite));
}

// NOLINTNEXTLINE
TEST(PathGuard, RelativeToCwd) {
  PathGuard guard("/tmp/sb/box");
  EXPECT_TRUE(guard.IsAllowed("x", PathGuard::Access::kWrite,
                              "/tmp/sb/box/submission"));
  EXPECT_FALSE(guard.IsAllowed("x", PathGuard::Access::kWrite, "/tmp"));
}

}  // namespace
