#include "util/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <kj/debug.h>
#include <kj/exception.h>

namespace {

const constexpr char* kPathSeparators = "/";
const size_t max_path_len = 1 << 15;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

// Checks that a mkstemp-style template fits in a path.
std::string PathTemplate(const std::string& tmp) {
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  return tmp;
}

kj::AutoCloseFd OsTempFile(const std::string& path, const std::string& suffix,
                           std::string* tmp) {
  *tmp = PathTemplate(util::File::JoinPath(path, "XXXXXX") + suffix);
  int fd = mkostemps(&(*tmp)[0], suffix.size(), O_CLOEXEC);  // NOLINT
  return kj::AutoCloseFd(fd);
}

}  // namespace

namespace util {

std::string File::ReadFd(int fd, uint64_t limit) {
  std::string data;
  char buf[kChunkSize];
  while (true) {
    ssize_t amount = read(fd, buf, kChunkSize);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "read");
    }
    if (amount == 0) break;
    if (data.size() + amount > limit) {
      throw std::system_error(EFBIG, std::system_category(), "read");
    }
    data.append(buf, amount);
  }
  return data;
}

std::string File::Read(const std::string& path, uint64_t limit) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return ReadFd(fd.get(), limit);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Copy(const std::string& from, const std::string& to) {
  kj::AutoCloseFd in{open(from.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (in.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Copy " + from);
  }
  kj::AutoCloseFd out{open(to.c_str(),  // NOLINT
                           O_CLOEXEC | O_WRONLY | O_CREAT | O_TRUNC,
                           S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH)};
  if (out.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Copy " + to);
  }
  char buf[kChunkSize];
  while (true) {
    ssize_t amount = read(in, buf, kChunkSize);  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Copy " + from);
    }
    if (amount == 0) break;
    ssize_t pos = 0;
    while (pos < amount) {
      ssize_t written = write(out, buf + pos, amount - pos);  // NOLINT
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        throw std::system_error(errno, std::system_category(), "Copy " + to);
      }
      pos += written;
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

TempFile::TempFile(const std::string& base, const std::string& suffix) {
  File::MakeDirs(base);
  fd_ = OsTempFile(base, suffix, &path_);
  if (fd_.get() == -1) {
    throw std::system_error(errno, std::system_category(), "mkostemps");
  }
}

void TempFile::Write(kj::ArrayPtr<const kj::byte> data) {
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t written = write(fd_, data.begin() + pos,  // NOLINT
                            data.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(),
                              "write " + path_);
    }
    pos += written;
  }
}

TempFile::~TempFile() {  // NOLINT
  kj::UnwindDetector detector;
  detector.catchExceptionsIfUnwinding([&]() { File::Remove(path_); });
}

}  // namespace util
