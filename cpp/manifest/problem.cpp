#include "manifest/problem.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/problem.capnp.h"
#include "util/file.hpp"

namespace manifest {

namespace {

namespace schema = capnproto::problem;

kj::Maybe<uint64_t> Optional(uint64_t value) {
  if (value == 0) return nullptr;
  return value;
}

kj::Maybe<std::string> Optional(bool has, capnp::Text::Reader text) {
  if (!has || text.size() == 0) return nullptr;
  return std::string(text.cStr());
}

std::vector<std::string> Strings(capnp::List<capnp::Text>::Reader list) {
  std::vector<std::string> res;
  res.reserve(list.size());
  for (auto s : list) res.emplace_back(s.cStr());
  return res;
}

Limits FromCapnp(schema::Limits::Reader reader) {
  Limits limits;
  limits.memory = Optional(reader.getMemory());
  limits.time = Optional(reader.getTime());
  limits.process_count = Optional(reader.getProcessCount());
  return limits;
}

TestSpec FromCapnp(schema::Test::Reader reader) {
  TestSpec test;
  auto gen = reader.getGen();
  switch (gen.which()) {
    case schema::Test::Gen::GENERATE: {
      GenerateTest generate;
      generate.testgen = gen.getGenerate().getTestgen().cStr();
      generate.args = Strings(gen.getGenerate().getArgs());
      test.gen.init<GenerateTest>(kj::mv(generate));
      break;
    }
    case schema::Test::Gen::FIXTURE: {
      FileTest file;
      file.path = gen.getFixture().getPath().cStr();
      test.gen.init<FileTest>(kj::mv(file));
      break;
    }
    default:
      KJ_FAIL_REQUIRE("unknown test generation method", gen.which());
  }
  test.limits = FromCapnp(reader.getLimits());
  test.group = reader.getGroup().cStr();
  return test;
}

}  // namespace

bool Problem::NeedsAnswers() const {
  if (check.is<BuiltinCheck>()) return true;
  if (check.is<CustomCheck>()) return check.get<CustomCheck>().pass_correct;
  return false;
}

Problem ParseProblem(kj::StringPtr json) {
  capnp::JsonCodec codec;
  codec.handleByAnnotation<schema::Problem>();
  capnp::MallocMessageBuilder message;
  auto builder = message.initRoot<schema::Problem>();
  codec.decode(json, builder);
  auto reader = builder.asReader();

  Problem problem;
  problem.title = reader.getTitle().cStr();
  problem.name = reader.getName().cStr();
  problem.limits = FromCapnp(reader.getLimits());
  for (auto test : reader.getTests()) {
    problem.tests.push_back(FromCapnp(test));
  }
  auto check = reader.getCheck();
  switch (check.which()) {
    case schema::Problem::Check::CUSTOM: {
      CustomCheck custom;
      custom.pass_correct = check.getCustom().getPassCorrect();
      problem.check.init<CustomCheck>(custom);
      break;
    }
    case schema::Problem::Check::BUILTIN: {
      BuiltinCheck builtin;
      builtin.name = check.getBuiltin().getName().cStr();
      KJ_REQUIRE(!builtin.name.empty(), "builtin checker without a name");
      problem.check.init<BuiltinCheck>(kj::mv(builtin));
      break;
    }
    default:
      KJ_FAIL_REQUIRE("unknown checker kind", check.which());
  }
  problem.check_args = Strings(reader.getCheckOptions().getArgs());
  problem.primary_solution =
      Optional(reader.hasPrimarySolution(), reader.getPrimarySolution());
  problem.valuer_cfg = Optional(reader.hasValuerCfg(), reader.getValuerCfg());
  return problem;
}

Problem LoadProblem(const std::string& path) {
  KJ_CONTEXT("reading problem manifest", path);
  std::string json = util::File::ReadAll(path);
  return ParseProblem(kj::StringPtr(json.c_str(), json.size()));
}

}  // namespace manifest
