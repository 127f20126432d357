#include "util/file.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <set>

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsExists(const std::string& path) {
  struct stat buf {};
  return lstat(path.c_str(), &buf) != -1;
}

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  files.clear();
  if (nftw(path.c_str(),
           [](const char* fpath, const struct stat* sb, int typeflags,
              struct FTW* ftwbuf) {
             if (typeflags == FTW_F) files.emplace_back(fpath);
             return 0;
           },
           64, FTW_PHYS) == -1) {
    throw std::system_error(errno, std::system_category(), "nftw " + path);
  }
  std::vector<std::string> ret;
  ret.reserve(files.size());
  for (std::string& file : files) {
    ret.push_back(file.substr(path.size() + 1));
  }
  files.clear();
  std::sort(ret.begin(), ret.end());
  return ret;
}

// Directories are made writable before the tree is removed, so that trees
// containing read-only folders can still be removed. nftw does not descend
// into a directory it could not read, so the pass is repeated until no new
// unreadable directory shows up.
bool OsRemoveTree(const std::string& path) {
  struct stat buf {};
  if (lstat(path.c_str(), &buf) == -1) return false;
  if (S_ISDIR(buf.st_mode)) {
    thread_local std::set<std::string> unlocked;
    thread_local bool found_locked;
    unlocked.clear();
    chmod(path.c_str(), buf.st_mode | S_IRWXU);
    do {
      found_locked = false;
      nftw(path.c_str(),
           [](const char* fpath, const struct stat* sb, int typeflags,
              struct FTW* ftwbuf) {
             if (typeflags != FTW_D && typeflags != FTW_DNR) return 0;
             if (chmod(fpath, sb->st_mode | S_IRWXU) == -1) return 0;
             if (typeflags == FTW_DNR && unlocked.insert(fpath).second) {
               found_locked = true;
             }
             return 0;
           },
           64, FTW_PHYS | FTW_MOUNT);
    } while (found_locked);
    unlocked.clear();
  }
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

bool OsMakeImmutable(const std::string& path) {
  return chmod(path.c_str(), S_IRUSR) != -1;
}

std::string OsTempDir(const std::string& path, const std::string& prefix) {
  std::string tmp = util::File::JoinPath(path, prefix + "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
#ifdef __APPLE__
  *tmp = path + ".";
  do {
    *tmp += 'a' + rand() % 26;
    int fd = open(tmp->c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
    if (fd == -1 && errno == EEXIST) continue;
    return fd;
  } while (true);
#else
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
#endif
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
  }
  return remove(src.c_str()) != -1 ? 0 : errno;
}

int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver, int64_t limit) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  int64_t total = 0;
  try {
    while ((amount = read(fd, buf, util::kChunkSize))) {
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      if (limit >= 0 && total + amount > limit) amount = limit - total;
      total += amount;
      if (amount > 0) chunk_receiver(buf, amount);
      if (limit >= 0 && total >= limit) break;
    }
  } catch (...) {
    close(fd);
    throw;
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

int OsWrite(const std::string& path,
            const util::File::ChunkProducer& chunk_producer, bool overwrite,
            bool exist_ok) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  try {
    chunk_producer([&fd, &temp_file](const char* data, size_t size) {
      size_t pos = 0;
      while (pos < size) {
        ssize_t written = write(fd, data + pos, size - pos);
        if (written == -1 && errno == EINTR) continue;
        if (written == -1) {
          throw std::system_error(errno, std::system_category(),
                                  "write " + temp_file);
        }
        pos += written;
      }
    });
  } catch (...) {
    close(fd);
    remove(temp_file.c_str());
    throw;
  }
  if (close(fd) == -1) return errno;
  return OsAtomicMove(temp_file, path, overwrite, exist_ok);
}

}  // namespace
#elif defined(_WIN32)
#include <windows.h>

namespace {

const constexpr char* kPathSeparators = "\\/";

bool MkDir(const std::string& dir) {
  return CreateDirectoryA(dir.c_str(), nullptr) ||
         GetLastError() == ERROR_ALREADY_EXISTS;
}

bool OsExists(const std::string& path) {
  return GetFileAttributesA(path.c_str()) != INVALID_FILE_ATTRIBUTES;
}

void OsListFilesInto(const std::string& root, const std::string& rel,
                     std::vector<std::string>* out) {
  WIN32_FIND_DATAA data;
  std::string dir = rel.empty() ? root : util::File::JoinPath(root, rel);
  HANDLE find = FindFirstFileA((dir + "\\*").c_str(), &data);
  if (find == INVALID_HANDLE_VALUE) return;
  do {
    std::string name = data.cFileName;
    if (name == "." || name == "..") continue;
    std::string child = rel.empty() ? name : rel + "\\" + name;
    if (data.dwFileAttributes & FILE_ATTRIBUTE_DIRECTORY) {
      OsListFilesInto(root, child, out);
    } else {
      out->push_back(child);
    }
  } while (FindNextFileA(find, &data));
  FindClose(find);
}

std::vector<std::string> OsListFiles(const std::string& path) {
  std::vector<std::string> ret;
  OsListFilesInto(path, "", &ret);
  std::sort(ret.begin(), ret.end());
  return ret;
}

bool OsRemoveTree(const std::string& path) {
  DWORD attrs = GetFileAttributesA(path.c_str());
  if (attrs == INVALID_FILE_ATTRIBUTES) {
    errno = ENOENT;
    return false;
  }
  SetFileAttributesA(path.c_str(), attrs & ~FILE_ATTRIBUTE_READONLY);
  if (!(attrs & FILE_ATTRIBUTE_DIRECTORY)) {
    return DeleteFileA(path.c_str()) != 0;
  }
  WIN32_FIND_DATAA data;
  HANDLE find = FindFirstFileA((path + "\\*").c_str(), &data);
  if (find != INVALID_HANDLE_VALUE) {
    do {
      std::string name = data.cFileName;
      if (name == "." || name == "..") continue;
      OsRemoveTree(util::File::JoinPath(path, name));
    } while (FindNextFileA(find, &data));
    FindClose(find);
  }
  if (!RemoveDirectoryA(path.c_str())) {
    errno = EACCES;
    return false;
  }
  return true;
}

bool OsMakeImmutable(const std::string& path) {
  return SetFileAttributesA(path.c_str(), FILE_ATTRIBUTE_READONLY) != 0;
}

std::string OsTempDir(const std::string& path, const std::string& prefix) {
  for (int attempt = 0; attempt < 100; attempt++) {
    std::string candidate = util::File::JoinPath(
        path, prefix + std::to_string(GetCurrentProcessId()) + "_" +
                  std::to_string(GetTickCount64() + attempt));
    if (CreateDirectoryA(candidate.c_str(), nullptr)) return candidate;
    if (GetLastError() != ERROR_ALREADY_EXISTS) break;
  }
  errno = EACCES;
  return "";
}

int OsRead(const std::string& path,
           const util::File::ChunkReceiver& chunk_receiver, int64_t limit) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return ENOENT;
  char buf[util::kChunkSize] = {};
  int64_t total = 0;
  while (fin) {
    fin.read(buf, util::kChunkSize);
    int64_t amount = fin.gcount();
    if (limit >= 0 && total + amount > limit) amount = limit - total;
    total += amount;
    if (amount > 0) chunk_receiver(buf, amount);
    if (limit >= 0 && total >= limit) break;
  }
  return 0;
}

int OsWrite(const std::string& path,
            const util::File::ChunkProducer& chunk_producer, bool overwrite,
            bool exist_ok) {
  std::string temp_file = path + ".tmp" + std::to_string(GetTickCount64());
  {
    std::ofstream fout(temp_file, std::ios::binary | std::ios::trunc);
    if (!fout) return EACCES;
    chunk_producer([&fout](const char* data, size_t size) {
      fout.write(data, size);
    });
    if (!fout) return EIO;
  }
  DWORD flags = overwrite ? MOVEFILE_REPLACE_EXISTING : 0;
  if (!MoveFileExA(temp_file.c_str(), path.c_str(), flags)) {
    DWORD error = GetLastError();
    DeleteFileA(temp_file.c_str());
    if (error == ERROR_ALREADY_EXISTS && exist_ok) return 0;
    return error == ERROR_ALREADY_EXISTS ? EEXIST : EACCES;
  }
  return 0;
}

}  // namespace
#endif

namespace util {

void File::Read(const std::string& path,
                const File::ChunkReceiver& chunk_receiver, int64_t limit) {
  int err = OsRead(path, chunk_receiver, limit);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
}

std::string File::ReadAll(const std::string& path, int64_t limit) {
  std::string contents;
  Read(path,
       [&contents](const char* data, size_t size) {
         contents.append(data, size);
       },
       limit);
  return contents;
}

void File::Write(const std::string& path, const ChunkProducer& chunk_producer,
                 bool overwrite, bool exist_ok) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) {
    if (exist_ok) return;
    throw file_exists("Write " + path);
  }
  int err = OsWrite(path, chunk_producer, overwrite, exist_ok);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::WriteAll(const std::string& path, const std::string& contents,
                    bool overwrite, bool exist_ok) {
  Write(path,
        [&contents](const ChunkReceiver& receiver) {
          receiver(contents.data(), contents.size());
        },
        overwrite, exist_ok);
}

std::vector<std::string> File::ListFiles(const std::string& path) {
  return OsListFiles(path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(),
                              "mkdir " + path.substr(0, pos));
    }
  }
}

void File::DeepCopy(const std::string& from, const std::string& to,
                    bool overwrite, bool exist_ok) {
  Write(to,
        [&from](const ChunkReceiver& receiver) { Read(from, receiver); },
        overwrite, exist_ok);
}

std::vector<std::string> File::CopyTree(const std::string& from,
                                        const std::string& to) {
  std::vector<std::string> copied;
  MakeDirs(to);
  for (const std::string& file : ListFiles(from)) {
    std::string dest = JoinPath(to, file);
    DeepCopy(JoinPath(from, file), dest, /*overwrite=*/true);
    copied.push_back(std::move(dest));
  }
  return copied;
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

void File::MakeImmutable(const std::string& path) {
  if (!OsMakeImmutable(path))
    throw std::system_error(errno, std::system_category(), "chmod " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && strchr(kPathSeparators, first.back()))
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return path.substr(0, 1);
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

bool File::Exists(const std::string& path) { return OsExists(path); }

bool File::IsDirectory(const std::string& path) {
  // A directory always has a "." entry.
  return OsExists(JoinPath(path, "."));
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(base, prefix);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (!keep_ && !moved_ && File::Exists(path_)) {
    try {
      File::RemoveTree(path_);
    } catch (const std::system_error& exc) {
      fprintf(stderr, "TempDir: %s\n", exc.what());  // NOLINT
    }
  }
}

}  // namespace util
