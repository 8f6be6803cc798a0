#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <memory>
#include <string>

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/function.h>

namespace util {

static const constexpr uint32_t kChunkSize = 1024 * 1024;

class File {
 public:
  // A non-owning pointer to a sequence of bytes, usually representing a part of
  // a file.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // A ChunkReceiver is a function that should be called one or more times with
  // a valid Chunk. An empty Chunk represents EOF.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Subsequent calls to this function produce consecutive Chunks from some
  // source. On EOF, an empty Chunk is returned.
  using ChunkProducer = kj::Function<Chunk()>;

  // Reads the file specified by path in chunks.
  static ChunkProducer Read(const std::string& path);

  // Returns a receiver that writes to the given file, the file ends when an
  // empty chunk is received, and finalizes the write when destroyed.
  static ChunkReceiver Write(const std::string& path, bool overwrite = false,
                             bool exist_ok = true);

  // Reads the whole content of a file.
  static std::string ReadAll(const std::string& path);

  // Atomically replaces the content of path with data.
  static void WriteAll(const std::string& path,
                       kj::ArrayPtr<const kj::byte> data);
  static void WriteAll(const std::string& path, const std::string& data) {
    WriteAll(path, kj::arrayPtr(reinterpret_cast<const kj::byte*>(  // NOLINT
                                    data.data()),
                                data.size()));
  }

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Copies from -> to byte by byte. The copy never shares an inode with the
  // source.
  static void HardCopy(const std::string& from, const std::string& to,
                       bool overwrite = false, bool exist_ok = true,
                       bool make_dirs = true);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Make a file executable by everyone.
  static void MakeExecutable(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // File name without its last extension. Empty for "", "." and "..".
  static std::string Stem(const std::string& path);

  // Last extension of the file name, including the dot, or "".
  static std::string Extension(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  static bool IsRegularFile(const std::string& path);
  static bool IsDirectory(const std::string& path);
};

// Owns a directory, which will be (recursively) removed on destruction.
class TempDir {
 public:
  // Takes ownership of an already existing directory.
  static TempDir Adopt(std::string path);

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
  KJ_DISALLOW_COPY(TempDir);

 private:
  TempDir() = default;

  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
