#ifndef MANIFEST_PACKAGE_HPP
#define MANIFEST_PACKAGE_HPP

#include <string>
#include <vector>

#include <kj/common.h>

#include "manifest/limits.hpp"

namespace manifest {

// A path inside the package, relative to the assets directory.
struct FileRef {
  enum class Root { PROBLEM };

  std::string path;
  Root root = Root::PROBLEM;

  static FileRef Problem(std::string path) {
    FileRef ref;
    ref.path = std::move(path);
    return ref;
  }
};

struct Test {
  FileRef path;
  kj::Maybe<FileRef> correct;
  Limits limits;
  std::string group;
};

struct ChildValuer {
  FileRef exe;
  std::vector<std::string> extra_args;
};

// Manifest of a built problem package.
struct Package {
  std::string title;
  std::string name;
  FileRef checker_exe;
  std::vector<std::string> checker_cmd;
  ChildValuer valuer;
  std::vector<Test> tests;
  FileRef valuer_config;
};

// Encodes the package manifest as JSON.
std::string EncodePackage(const Package& package);

// Writes the package manifest to <out_dir>/manifest.json.
void WritePackage(const Package& package, const std::string& out_dir);

}  // namespace manifest

#endif
