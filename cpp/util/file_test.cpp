#include "util/file.hpp"
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <system_error>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/scriptbox_testdir";

int unlink_cb(const char* fpath, const struct stat* /*unused*/, int /*unused*/,
              struct FTW* /*unused*/) {
  int rv = remove(fpath);
  if (rv) perror(fpath);
  return rv;
}

int rmrf(const char* path) {
  return nftw(path, unlink_cb, 64, FTW_DEPTH | FTW_PHYS);
}

bool exists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0;
}

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

class FileTest : public ::testing::Test {
 protected:
  void SetUp() override { util::File::MakeDirs(test_tmpdir); }
  void TearDown() override { rmrf(test_tmpdir.c_str()); }
  std::string Path(const std::string& name) const {
    return util::File::JoinPath(test_tmpdir, name);
  }
};

// NOLINTNEXTLINE
TEST_F(FileTest, ReadWholeFile) {
  writeFile(Path("snippet.py"), "print(1)\n");
  EXPECT_EQ(util::File::Read(Path("snippet.py"), 1024), "print(1)\n");
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadOverLimit) {
  writeFile(Path("big"), std::string(100, 'x'));
  EXPECT_THROW(util::File::Read(Path("big"), 99), std::system_error);
  EXPECT_EQ(util::File::Read(Path("big"), 100).size(), 100u);
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadMissing) {
  EXPECT_THROW(util::File::Read(Path("missing"), 10), std::system_error);
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadFdUntilEof) {
  int fds[2];
  ASSERT_NE(pipe(fds), -1);
  ASSERT_EQ(write(fds[1], "abc", 3), 3);
  close(fds[1]);
  EXPECT_EQ(util::File::ReadFd(fds[0], 10), "abc");
  close(fds[0]);
}

// NOLINTNEXTLINE
TEST_F(FileTest, CopyReplaces) {
  writeFile(Path("a"), "new contents");
  writeFile(Path("b"), "old contents that are longer");
  util::File::Copy(Path("a"), Path("b"));
  EXPECT_EQ(readFile(Path("b")), "new contents");
  EXPECT_EQ(readFile(Path("a")), "new contents");
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempFileIsRemoved) {
  std::string path;
  {
    util::TempFile file(test_tmpdir, ".png");
    path = file.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    EXPECT_THAT(path, EndsWith(".png"));
    std::string data = "\x89PNG";
    file.Write(kj::arrayPtr(reinterpret_cast<const kj::byte*>(data.data()),
                            data.size()));
    EXPECT_EQ(readFile(path), data);
  }
  EXPECT_FALSE(exists(path));
}

// NOLINTNEXTLINE
TEST_F(FileTest, TempFileNamesDiffer) {
  util::TempFile a(test_tmpdir, ".png");
  util::TempFile b(test_tmpdir, ".png");
  EXPECT_NE(a.Path(), b.Path());
}

// NOLINTNEXTLINE
TEST_F(FileTest, MakeDirs) {
  util::File::MakeDirs(Path("a/b/c"));
  EXPECT_TRUE(exists(Path("a/b/c")));
  // Existing directories are fine.
  util::File::MakeDirs(Path("a/b"));
}

// NOLINTNEXTLINE
TEST_F(FileTest, Remove) {
  writeFile(Path("gone"), "x");
  util::File::Remove(Path("gone"));
  EXPECT_FALSE(exists(Path("gone")));
  EXPECT_THROW(util::File::Remove(Path("gone")), std::system_error);
}

// NOLINTNEXTLINE
TEST(File, Paths) {
  EXPECT_EQ(util::File::JoinPath("/tmp", "x.png"), "/tmp/x.png");
  EXPECT_EQ(util::File::JoinPath("/tmp", "/abs"), "/abs");
  EXPECT_EQ(util::File::BaseName("/tmp/x.png"), "x.png");
}

}  // namespace
