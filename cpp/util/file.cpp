#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <array>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) !=
             -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS) != -1;
}

bool OsMakeExecutable(const std::string& path) {
  return chmod(path.c_str(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH |
                                 S_IXOTH) != -1;
}

const size_t max_path_len = 1 << 15;

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  kj::AutoCloseFd owned(fd);
  // mkostemp creates the file as 0600; written files are readable by all.
  if (fd != -1 && fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    int error = errno;
    remove(data);
    errno = error;
    return kj::AutoCloseFd();
  }
  return owned;
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
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkProducer OsRead(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  return [fd = std::move(fd), path,
          buf = std::array<kj::byte, util::kChunkSize>()]() mutable {
    if (fd.get() == -1) return util::File::Chunk();
    ssize_t amount;
    while ((amount = read(fd, buf.data(), util::kChunkSize))) {  // NOLINT
      if (amount == -1 && errno == EINTR) continue;
      if (amount == -1) break;
      return util::File::Chunk(buf.data(), amount);
    }
    if (amount == -1) {
      fd = nullptr;
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    return util::File::Chunk();
  };
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite,
                                  bool exist_ok) {
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
  return [fd = std::move(fd), temp_file, path, overwrite, exist_ok,
          done = std::move(done),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      if (fsync(fd) == -1 ||
          OsAtomicMove(temp_file, path, overwrite, exist_ok)) {
        throw std::system_error(errno, std::system_category(), "Write " + path);
      }
      fd = kj::AutoCloseFd();
      return;
    }
    size_t pos = 0;
    while (pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + pos,  // NOLINT
                              chunk.size() - pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        fd = nullptr;
        throw std::system_error(errno, std::system_category(),
                                "Write " + temp_file);
      }
      pos += written;
    }
  };
}

}  // namespace

namespace util {

File::ChunkProducer File::Read(const std::string& path) { return OsRead(path); }

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  MakeDirs(BaseDir(path));
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return [](Chunk chunk) {};
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite, exist_ok);
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

void File::WriteAll(const std::string& path,
                    kj::ArrayPtr<const kj::byte> data) {
  auto receiver = Write(path, /*overwrite=*/true);
  if (data.size() != 0) receiver(data);
  receiver(Chunk());
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

void File::HardCopy(const std::string& from, const std::string& to,
                    bool overwrite, bool exist_ok, bool make_dirs) {
  if (make_dirs) MakeDirs(BaseDir(to));
  auto producer = Read(from);
  auto receiver = Write(to, overwrite, exist_ok);
  Chunk chunk;
  while ((chunk = producer()).size()) {
    receiver(chunk);
  }
  receiver(chunk);
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

void File::MakeExecutable(const std::string& path) {
  if (!OsMakeExecutable(path)) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (first.empty()) return second;
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

std::string File::Stem(const std::string& path) {
  std::string name = BaseName(path);
  if (name == "." || name == "..") return "";
  size_t dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) return name;
  return name.substr(0, dot);
}

std::string File::Extension(const std::string& path) {
  std::string name = BaseName(path);
  size_t dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0 || name == "..") return "";
  return name.substr(dot);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsRegularFile(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

TempDir TempDir::Adopt(std::string path) {
  TempDir dir;
  dir.path_ = std::move(path);
  return dir;
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
