#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <dirent.h>
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

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  files.clear();
  if (nftw(path.c_str(),
           [](const char* fpath, const struct stat* /*sb*/, int typeflags,
              struct FTW* /*ftwbuf*/) {
             if (typeflags != FTW_F) return 0;
             files.emplace_back(fpath);
             return 0;
           },
           64, FTW_PHYS) == -1) {
    throw std::system_error(errno, std::system_category(), "nftw " + path);
  }
  std::vector<std::string> ret;
  ret.reserve(files.size());
  std::string prefix = path.back() == '/' ? path : path + "/";
  for (auto& f : files) {
    if (f.compare(0, prefix.size(), prefix) == 0) {
      ret.push_back(f.substr(prefix.size()));
    } else {
      ret.push_back(std::move(f));
    }
  }
  files.clear();
  std::sort(ret.begin(), ret.end());
  return ret;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp.begin(), tmp.end());
  data.push_back('\0');
  if (mkdtemp(data.data()) == nullptr) return "";
  return data.data();
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  KJ_REQUIRE(tmp->size() < max_path_len, tmp->size(), max_path_len,
             "Path too long");
  std::vector<char> data(tmp->begin(), tmp->end());
  data.push_back('\0');
  int fd = mkostemp(data.data(), O_CLOEXEC);
  *tmp = data.data();
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkProducer OsRead(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  auto buf = kj::heap<std::array<kj::byte, util::kChunkSize>>();
  return [fd = std::move(fd), path, buf = std::move(buf)]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    while ((amount = read(fd, buf->data(), util::kChunkSize))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      return util::File::Chunk(buf->data(), amount);
    }
    if (amount == -1) {
      int err = errno;
      fd = nullptr;
      throw std::system_error(err, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>(false);
  auto finalize = [done = done.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::Remove(temp_file); });
    }
  };
  return [fd = std::move(fd), temp_file, path, overwrite,
          done = std::move(done),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      if (fsync(fd) == -1) {
        throw std::system_error(errno, std::system_category(), "Write " + path);
      }
      int err = OsAtomicMove(temp_file, path, overwrite);
      if (err) {
        throw std::system_error(err, std::system_category(), "Write " + path);
      }
      *done = true;
      fd = kj::AutoCloseFd();
      return;
    }
    size_t pos = 0;
    while (pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + pos,  // NOLINT
                              chunk.size() - pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        int err = errno;
        fd = nullptr;
        throw std::system_error(err, std::system_category(),
                                "write " + temp_file);
      }
      pos += written;
    }
  };
}

}  // namespace

namespace util {
std::vector<std::string> File::ListFiles(const std::string& path) {
  if (!Exists(path)) return {};
  return OsListFiles(path);
}

std::vector<std::string> File::ListDirectories(const std::string& path) {
  std::vector<std::string> ret;
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    if (errno == ENOENT) return ret;
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  KJ_DEFER(closedir(dir));
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    struct stat st {};
    if (lstat(JoinPath(path, name).c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
      ret.push_back(name);
    }
  }
  std::sort(ret.begin(), ret.end());
  return ret;
}

File::ChunkProducer File::Read(const std::string& path) {
  return OsRead(path);
}

File::ChunkReceiver File::Write(const std::string& path, bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Size(path) >= 0) {
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite);
}

std::string File::ReadAll(const std::string& path) {
  auto producer = Read(path);
  std::string content;
  Chunk chunk;
  while ((chunk = producer()).size()) {
    content.append(chunk.asChars().begin(), chunk.size());
  }
  return content;
}

void File::WriteAll(const std::string& path, const std::string& content) {
  auto receiver = Write(path);
  if (!content.empty()) {
    receiver(Chunk(reinterpret_cast<const kj::byte*>(content.data()),  // NOLINT
                   content.size()));
  }
  receiver(Chunk());
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

std::chrono::system_clock::time_point File::ModificationTime(
    const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    throw std::system_error(errno, std::system_category(), "stat " + path);
  }
  return std::chrono::system_clock::from_time_t(st.st_mtime);
}

bool File::IsSafeRelativePath(const std::string& name) {
  if (name.empty()) return false;
  if (name.find('\0') != std::string::npos) return false;
  if (name[0] == '/') return false;
  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find('/', start);
    if (end == std::string::npos) end = name.size();
    if (name.compare(start, end - start, "..") == 0 && end - start == 2)
      return false;
    start = end + 1;
  }
  return true;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
