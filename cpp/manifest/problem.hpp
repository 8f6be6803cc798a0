#ifndef MANIFEST_PROBLEM_HPP
#define MANIFEST_PROBLEM_HPP

#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>

#include "manifest/limits.hpp"

namespace manifest {

// The input of a test is the stdout of a generator run with args.
struct GenerateTest {
  std::string testgen;
  std::vector<std::string> args;
};

// The input of a test is a file under the tests/ directory of the problem.
struct FileTest {
  std::string path;
};

struct TestSpec {
  kj::OneOf<GenerateTest, FileTest> gen;
  Limits limits;
  std::string group;
};

// Checker built from checkers/main.cpp. If pass_correct is set the checker
// receives the reference answers, which are then generated.
struct CustomCheck {
  bool pass_correct = false;
};

// Checker shipped with the build environment.
struct BuiltinCheck {
  std::string name;
};

struct Problem {
  std::string title;
  std::string name;
  Limits limits;
  std::vector<TestSpec> tests;
  kj::OneOf<CustomCheck, BuiltinCheck> check;
  std::vector<std::string> check_args;
  kj::Maybe<std::string> primary_solution;
  kj::Maybe<std::string> valuer_cfg;

  // Whether reference answers must be produced by the primary solution.
  bool NeedsAnswers() const;
};

// Decodes a problem manifest from its JSON representation. Throws on
// malformed input.
Problem ParseProblem(kj::StringPtr json);

// Reads and decodes the problem manifest at path.
Problem LoadProblem(const std::string& path);

}  // namespace manifest

#endif
