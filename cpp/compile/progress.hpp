#ifndef COMPILE_PROGRESS_HPP
#define COMPILE_PROGRESS_HPP

#include <cstddef>
#include <string>

namespace compile {

struct CompileUpdate {
  enum class Type {
    BUILD_MODULE,
    BUILD_SOLUTION,
    BUILD_TESTGEN,
    BUILD_CHECKER,
    GENERATE_TESTS,
    GENERATE_TEST,
    COPY_VALUER_CONFIG
  };

  Type type;
  // Identifier of the module, solution or testgen being built.
  std::string name;
  // Number of tests for GENERATE_TESTS, test id for GENERATE_TEST.
  size_t count = 0;

  static CompileUpdate BuildModule(std::string name) {
    return {Type::BUILD_MODULE, std::move(name)};
  }
  static CompileUpdate BuildSolution(std::string name) {
    return {Type::BUILD_SOLUTION, std::move(name)};
  }
  static CompileUpdate BuildTestgen(std::string name) {
    return {Type::BUILD_TESTGEN, std::move(name)};
  }
  static CompileUpdate BuildChecker() { return {Type::BUILD_CHECKER, ""}; }
  static CompileUpdate GenerateTests(size_t count) {
    return {Type::GENERATE_TESTS, "", count};
  }
  static CompileUpdate GenerateTest(size_t test_id) {
    return {Type::GENERATE_TEST, "", test_id};
  }
  static CompileUpdate CopyValuerConfig() {
    return {Type::COPY_VALUER_CONFIG, ""};
  }

  std::string ToString() const;
};

// Receives the progress of a build. Sending never blocks the build and never
// fails it.
class ProgressWriter {
 public:
  virtual void Send(const CompileUpdate& update) = 0;
  virtual ~ProgressWriter() = default;
};

// Writes every update to the log.
class LogProgressWriter : public ProgressWriter {
 public:
  void Send(const CompileUpdate& update) override;
};

}  // namespace compile

#endif
