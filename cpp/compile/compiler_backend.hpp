#ifndef COMPILE_COMPILER_BACKEND_HPP
#define COMPILE_COMPILER_BACKEND_HPP

#include <string>
#include <vector>

#include "compile/build_backend.hpp"
#include "util/process.hpp"

namespace compile {

// Builds C and C++ sources with the system compilers and installs scripts
// as they are. The artifact always ends up in <dest>/bin.
class CompilerBackend : public BuildBackend {
 public:
  explicit CompilerBackend(util::ProcessRunner* runner) : runner_(*runner) {}

  kj::Promise<TaskResult> ProcessTask(BuildTask task) override;

 private:
  util::ProcessRunner& runner_;
};

// The file to build for src: src itself, or the main.<ext> entry point if
// src is a directory. Empty if a directory has no entry point.
std::string EntryPoint(const std::string& src);

// The compiler invocation for source, or an empty vector if source is a
// script.
std::vector<std::string> CompilerCommand(const std::string& source,
                                         const std::string& output);

}  // namespace compile

#endif
