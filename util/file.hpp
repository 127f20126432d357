#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Called once per chunk of data, in order.
  using ChunkReceiver = std::function<void(const char* data, size_t size)>;

  // Calls the given receiver once per chunk to produce the contents of a file.
  using ChunkProducer = std::function<void(const ChunkReceiver&)>;

  // Reads the file specified by path in chunks. At most limit bytes are read
  // if limit is positive.
  static void Read(const std::string& path,
                   const ChunkReceiver& chunk_receiver, int64_t limit = -1);

  // Reads a whole (possibly truncated) file into a string.
  static std::string ReadAll(const std::string& path, int64_t limit = -1);

  // Writes the data produced by chunk_producer to path. The file is first
  // written to a temporary file and then atomically moved in place.
  static void Write(const std::string& path,
                    const ChunkProducer& chunk_producer,
                    bool overwrite = false, bool exist_ok = true);

  // Writes the given string to path.
  static void WriteAll(const std::string& path, const std::string& contents,
                       bool overwrite = false, bool exist_ok = true);

  // Lists all the regular files below path, relative to path and sorted.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Copies from -> to without using hard links.
  static void DeepCopy(const std::string& from, const std::string& to,
                       bool overwrite = false, bool exist_ok = true);

  // Copies all the regular files below from into to, keeping the relative
  // layout. Returns the list of created files.
  static std::vector<std::string> CopyTree(const std::string& from,
                                           const std::string& to);

  // Recursively removes a tree. Fails with ENOENT if path does not exist.
  static void RemoveTree(const std::string& path);

  // Make a file read-only for its owner.
  static void MakeImmutable(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Returns true if a file or a directory exists at path.
  static bool Exists(const std::string& path);

  // Returns true if path is a directory.
  static bool IsDirectory(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created,
  // prefix is prepended to the random part of its name.
  explicit TempDir(const std::string& base, const std::string& prefix = "");

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
