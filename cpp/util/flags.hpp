#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;

  // Compile flags
  static std::string problem_dir;
  static std::string out_dir;
  static std::string build_env;
  static std::string manifest;
  static std::string build_root;
  static bool keep_build_dirs;
};

#endif
