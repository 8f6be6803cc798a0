#include "compile/progress.hpp"

#include <kj/debug.h>

namespace compile {

std::string CompileUpdate::ToString() const {
  switch (type) {
    case Type::BUILD_MODULE:
      return "Building module " + name;
    case Type::BUILD_SOLUTION:
      return "Building solution " + name;
    case Type::BUILD_TESTGEN:
      return "Building generator " + name;
    case Type::BUILD_CHECKER:
      return "Building checker";
    case Type::GENERATE_TESTS:
      return "Generating " + std::to_string(count) + " tests";
    case Type::GENERATE_TEST:
      return "Generating test " + std::to_string(count);
    case Type::COPY_VALUER_CONFIG:
      return "Copying valuer config";
  }
  KJ_UNREACHABLE;
}

void LogProgressWriter::Send(const CompileUpdate& update) {
  KJ_LOG(INFO, update.ToString());
}

}  // namespace compile
