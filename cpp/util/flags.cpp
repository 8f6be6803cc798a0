#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::problem_dir;
std::string Flags::out_dir;
std::string Flags::build_env;
std::string Flags::manifest;
std::string Flags::build_root = "/tmp";
bool Flags::keep_build_dirs = false;
