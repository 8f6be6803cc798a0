#ifndef COMPILE_MAIN_HPP
#define COMPILE_MAIN_HPP
#include <kj/main.h>

namespace compile {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace compile
#endif
