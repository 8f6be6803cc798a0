#include "compile/main.hpp"
#include "util/version.hpp"

class PpsMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit PpsMain(kj::ProcessContext& context)
      : context(context), cm(&context) {}
  kj::MainFunc getMain() {
    static const std::string title = "pps (" + util::version + ")";
    return kj::MainBuilder(context, title,
                           "Problem package compiler")
        .addSubCommand("compile", KJ_BIND_METHOD(cm, getMain),
                       "build a problem package")
        .build();
  }

 private:
  kj::ProcessContext& context;
  compile::Main cm;
};

KJ_MAIN(PpsMain);
