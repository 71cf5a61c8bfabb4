#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>

#include <kj/common.h>
#include <kj/io.h>

namespace util {

static const constexpr uint32_t kChunkSize = 64 * 1024;

class File {
 public:
  // Reads at most limit bytes from fd, until EOF.
  static std::string ReadFd(int fd, uint64_t limit);

  // Reads the whole file specified by path, which must not be longer than
  // limit bytes.
  static std::string Read(const std::string& path, uint64_t limit);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Copies from -> to, replacing to if it exists.
  static void Copy(const std::string& from, const std::string& to);

  // Removes a file.
  static void Remove(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);
};

// Creates a file with a unique name in a given folder. The file is removed
// on destruction.
class TempFile {
 public:
  // base is the directory in which the file will be created, suffix is
  // appended to its random name.
  TempFile(const std::string& base, const std::string& suffix);

  const std::string& Path() const { return path_; }

  // Appends data to the file.
  void Write(kj::ArrayPtr<const kj::byte> data);

  ~TempFile();
  KJ_DISALLOW_COPY(TempFile);

 private:
  std::string path_;
  kj::AutoCloseFd fd_;
};

}  // namespace util

#endif
