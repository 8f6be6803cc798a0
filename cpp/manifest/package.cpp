#include "manifest/package.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <cstdint>

#include "capnp/package.capnp.h"
#include "util/file.hpp"

namespace manifest {

namespace {

namespace schema = capnproto::package;

void ToCapnp(const FileRef& ref, schema::FileRef::Builder builder) {
  builder.setPath(ref.path.c_str());
  switch (ref.root) {
    case FileRef::Root::PROBLEM:
      builder.setRoot(schema::FileRefRoot::PROBLEM);
      break;
  }
}

void ToCapnp(const Limits& limits, schema::Limits::Builder builder) {
  KJ_IF_MAYBE(memory, limits.memory) { builder.setMemory(*memory); }
  KJ_IF_MAYBE(time, limits.time) {
    KJ_REQUIRE(*time <= UINT32_MAX, "time limit too large", *time);
    builder.setTime(*time);
  }
  KJ_IF_MAYBE(count, limits.process_count) {
    KJ_REQUIRE(*count <= UINT32_MAX, "process limit too large", *count);
    builder.setProcessCount(*count);
  }
}

void ToCapnp(const std::vector<std::string>& strings,
             capnp::List<capnp::Text>::Builder builder) {
  for (size_t i = 0; i < strings.size(); i++) {
    builder.set(i, strings[i].c_str());
  }
}

}  // namespace

std::string EncodePackage(const Package& package) {
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<schema::Package>();
  builder.setTitle(package.title.c_str());
  builder.setName(package.name.c_str());
  ToCapnp(package.checker_exe, builder.initCheckerExe());
  ToCapnp(package.checker_cmd,
          builder.initCheckerCmd(package.checker_cmd.size()));
  auto valuer = builder.initValuer().initChild();
  ToCapnp(package.valuer.exe, valuer.initExe());
  ToCapnp(package.valuer.extra_args,
          valuer.initExtraArgs(package.valuer.extra_args.size()));
  auto tests = builder.initTests(package.tests.size());
  for (size_t i = 0; i < package.tests.size(); i++) {
    const Test& test = package.tests[i];
    ToCapnp(test.path, tests[i].initPath());
    KJ_IF_MAYBE(correct, test.correct) {
      ToCapnp(*correct, tests[i].initCorrect());
    }
    ToCapnp(test.limits, tests[i].initLimits());
    tests[i].setGroup(test.group.c_str());
  }
  ToCapnp(package.valuer_config, builder.initValuerConfig());

  capnp::JsonCodec codec;
  codec.handleByAnnotation<schema::Package>();
  codec.setPrettyPrint(true);
  kj::String json = codec.encode(builder.asReader());
  return std::string(json.cStr(), json.size());
}

void WritePackage(const Package& package, const std::string& out_dir) {
  std::string path = util::File::JoinPath(out_dir, "manifest.json");
  KJ_CONTEXT("writing package manifest", path);
  util::File::WriteAll(path, EncodePackage(package));
}

}  // namespace manifest
